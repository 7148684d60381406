#pragma once
#include "md/tick_parser.hpp"
#include "md/symbol_codec.hpp"

#include <simdjson.h>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

// Binance combined-stream frames:
//   {"stream":"btcusdt@bookTicker","data":{"u":1,"s":"BTCUSDT","b":"..","B":"..","a":"..","A":".."}}
//   {"stream":"btcusdt@trade","data":{"e":"trade","E":1,"s":"BTCUSDT","t":1,"p":"..","q":"..","T":1700000000000,...}}
// bookTicker carries no event time, so quotes are stamped on receipt.
class BinanceTickParser : public ITickParser {
public:
    BinanceTickParser() = default;

    ParseResult parse(const std::string& raw, std::vector<Tick>& out) override {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) return ParseResult::Malformed;

        simdjson::ondemand::object root;
        if (doc.get_object().get(root)) return ParseResult::Malformed;

        std::string_view stream;
        if (root["stream"].get(stream)) {
            // {"result":null,"id":1} replies to control requests
            return raw.find("\"result\"") != std::string::npos ? ParseResult::Ignored
                                                                 : ParseResult::Malformed;
        }

        simdjson::ondemand::object data;
        if (root["data"].get(data)) return ParseResult::Malformed;

        if (ends_with(stream, "@bookTicker")) return parse_book_ticker(data, out);
        if (ends_with(stream, "@trade")) return parse_trade(data, out);
        return ParseResult::Ignored;
    }

private:
    ParseResult parse_book_ticker(simdjson::ondemand::object& data, std::vector<Tick>& out) {
        std::string_view sym, b, bq, a, aq;
        if (data["s"].get(sym)) return ParseResult::Malformed;
        if (data["b"].get(b) || data["B"].get(bq)) return ParseResult::Malformed;
        if (data["a"].get(a) || data["A"].get(aq)) return ParseResult::Malformed;

        Tick t;
        t.venue = "binance";
        t.symbol = SymbolCodec::to_canonical("binance", std::string(sym));
        t.kind = TickKind::Quote;
        if (!to_double(b, t.bid) || !to_double(bq, t.bid_size) ||
            !to_double(a, t.ask) || !to_double(aq, t.ask_size))
            return ParseResult::Malformed;
        if (t.bid < 0 || t.ask < 0 || t.bid_size < 0 || t.ask_size < 0) return ParseResult::Malformed;
        t.ts_ns = wall_clock_ns();
        out.emplace_back(std::move(t));
        return ParseResult::Parsed;
    }

    ParseResult parse_trade(simdjson::ondemand::object& data, std::vector<Tick>& out) {
        std::string_view sym, p, q;
        std::int64_t trade_ms = 0;
        if (data["s"].get(sym)) return ParseResult::Malformed;
        if (data["p"].get(p) || data["q"].get(q)) return ParseResult::Malformed;
        if (data["T"].get(trade_ms)) return ParseResult::Malformed;

        Tick t;
        t.venue = "binance";
        t.symbol = SymbolCodec::to_canonical("binance", std::string(sym));
        t.kind = TickKind::Trade;
        if (!to_double(p, t.trade_price) || !to_double(q, t.trade_size)) return ParseResult::Malformed;
        if (t.trade_price <= 0 || t.trade_size < 0) return ParseResult::Malformed;
        t.ts_ns = trade_ms * kNsPerMs;
        out.emplace_back(std::move(t));
        return ParseResult::Parsed;
    }

    static bool ends_with(std::string_view s, std::string_view suffix) {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    // Binance sends decimals as strings; avoids locale pitfalls of stream parsing
    static bool to_double(std::string_view sv, double& v) {
        if (sv.empty()) return false;
        std::string tmp(sv);
        char* end = nullptr;
        v = std::strtod(tmp.c_str(), &end);
        return end == tmp.c_str() + tmp.size();
    }

    simdjson::ondemand::parser parser_;
};
