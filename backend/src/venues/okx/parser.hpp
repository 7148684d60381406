#pragma once
#include "md/tick_parser.hpp"
#include "md/symbol_codec.hpp"

#include <simdjson.h>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

// OKX v5 public frames:
//   {"arg":{"channel":"tickers","instId":"BTC-USDT"},"data":[{"instId":"BTC-USDT","askPx":"..","askSz":"..","bidPx":"..","bidSz":"..","ts":"1700000000000",...}]}
//   {"arg":{"channel":"trades","instId":"BTC-USDT"},"data":[{"instId":"BTC-USDT","px":"..","sz":"..","side":"buy","ts":"1700000000000"}]}
// {"event":...} frames (subscribe acks, errors) and "pong" are control traffic.
class OkxTickParser : public ITickParser {
public:
    OkxTickParser() = default;

    ParseResult parse(const std::string& raw, std::vector<Tick>& out) override {
        if (raw == "pong") return ParseResult::Ignored;

        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) return ParseResult::Malformed;

        simdjson::ondemand::object root;
        if (doc.get_object().get(root)) return ParseResult::Malformed;

        std::string_view event;
        if (!root["event"].get(event)) {
            if (event == "error") std::cerr << "[okx-parser] error event: " << raw << "\n";
            return ParseResult::Ignored;
        }

        std::string_view channel;
        simdjson::ondemand::object arg;
        if (root["arg"].get(arg) || arg["channel"].get(channel)) return ParseResult::Malformed;

        const bool tickers = channel == "tickers";
        if (!tickers && channel != "trades") return ParseResult::Ignored;

        simdjson::ondemand::array data;
        if (root["data"].get(data)) return ParseResult::Malformed;

        const std::size_t before = out.size();
        bool bad = false;
        for (simdjson::ondemand::value item : data) {
            simdjson::ondemand::object o;
            if (item.get_object().get(o)) { bad = true; continue; }
            if (!(tickers ? parse_ticker(o, out) : parse_trade(o, out))) bad = true;
        }
        if (out.size() > before) return ParseResult::Parsed;
        return bad ? ParseResult::Malformed : ParseResult::Ignored;
    }

private:
    bool parse_ticker(simdjson::ondemand::object& o, std::vector<Tick>& out) {
        std::string_view inst, ap, as, bp, bs, ts;
        if (o["instId"].get(inst)) return false;
        if (o["askPx"].get(ap) || o["askSz"].get(as)) return false;
        if (o["bidPx"].get(bp) || o["bidSz"].get(bs)) return false;

        Tick t;
        t.venue = "okx";
        t.symbol = SymbolCodec::to_canonical("okx", std::string(inst));
        t.kind = TickKind::Quote;
        // OKX sends "" for a side with no resting orders
        if (!opt_double(bp, t.bid) || !opt_double(bs, t.bid_size) ||
            !opt_double(ap, t.ask) || !opt_double(as, t.ask_size))
            return false;
        if (t.bid < 0 || t.ask < 0 || t.bid_size < 0 || t.ask_size < 0) return false;
        t.ts_ns = o["ts"].get(ts) ? wall_clock_ns() : ms_to_ns(ts);
        out.emplace_back(std::move(t));
        return true;
    }

    bool parse_trade(simdjson::ondemand::object& o, std::vector<Tick>& out) {
        std::string_view inst, px, sz, ts;
        if (o["instId"].get(inst)) return false;
        if (o["px"].get(px) || o["sz"].get(sz)) return false;

        Tick t;
        t.venue = "okx";
        t.symbol = SymbolCodec::to_canonical("okx", std::string(inst));
        t.kind = TickKind::Trade;
        if (!to_double(px, t.trade_price) || !to_double(sz, t.trade_size)) return false;
        if (t.trade_price <= 0 || t.trade_size < 0) return false;
        t.ts_ns = o["ts"].get(ts) ? wall_clock_ns() : ms_to_ns(ts);
        out.emplace_back(std::move(t));
        return true;
    }

    static std::int64_t ms_to_ns(std::string_view ms) {
        double v = 0;
        if (!to_double(ms, v) || v <= 0) return wall_clock_ns();
        return static_cast<std::int64_t>(v) * kNsPerMs;
    }

    static bool opt_double(std::string_view sv, double& v) {
        if (sv.empty()) { v = 0.0; return true; }
        return to_double(sv, v);
    }

    static bool to_double(std::string_view sv, double& v) {
        if (sv.empty()) return false;
        std::string tmp(sv);
        char* end = nullptr;
        v = std::strtod(tmp.c_str(), &end);
        return end == tmp.c_str() + tmp.size();
    }

    simdjson::ondemand::parser parser_;
};
