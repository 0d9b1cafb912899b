#include "gateway_response_parser.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace SellManager {
namespace API {

namespace {

json parse_body(const std::string& response_body, const std::string& response_name) {
    json parsed_json = json::parse(response_body, nullptr, false);
    if (parsed_json.is_discarded()) {
        throw std::runtime_error("Invalid JSON in " + response_name + " response");
    }
    return parsed_json;
}

// The gateway sends ids and some numbers either as strings or as numbers.
std::string json_to_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    if (value.is_number()) return std::to_string(value.get<double>());
    return "";
}

double json_to_double(const json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) return std::stod(value.get<std::string>());
    throw std::runtime_error("Expected a numeric value");
}

std::string string_field(const json& object_json, const char* field_name) {
    if (!object_json.contains(field_name) || object_json[field_name].is_null()) {
        return "";
    }
    return json_to_string(object_json[field_name]);
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return value;
}

} // namespace

std::optional<std::string> parse_conid_search_response(const std::string& response_body, const std::string& exchange) {
    json search_json = parse_body(response_body, "contract search");
    if (!search_json.is_array() || search_json.empty()) {
        return std::nullopt;
    }

    std::string wanted_exchange = to_upper(exchange);
    std::optional<std::string> first_conid;
    for (const auto& search_hit : search_json) {
        std::string conid_string = string_field(search_hit, "conid");
        if (conid_string.empty()) {
            continue;
        }
        if (!first_conid) {
            first_conid = conid_string;
        }
        if (!wanted_exchange.empty() && to_upper(string_field(search_hit, "description")) == wanted_exchange) {
            return conid_string;
        }
    }
    return first_conid;
}

Core::Series parse_history_response(const std::string& response_body, Core::Granularity granularity,
                                    Core::Timestamp end_time, int max_count, const Core::ExchangeSessionClock& session_clock) {
    json history_json = parse_body(response_body, "history");
    Core::Series parsed_bars;
    if (!history_json.contains("data") || !history_json["data"].is_array()) {
        return parsed_bars;
    }

    for (const auto& bar_json : history_json["data"]) {
        if (!bar_json.contains("t")) {
            continue;
        }
        Core::Timestamp bar_timestamp = TimeUtils::convert_milliseconds_to_epoch_seconds(bar_json["t"].get<long long>());
        if (granularity == Core::Granularity::DAY) {
            long long local_seconds = session_clock.to_local_seconds(bar_timestamp);
            bar_timestamp = TimeUtils::floor_to_multiple(local_seconds, TimeUtils::SECONDS_PER_DAY);
        }
        if (end_time > 0 && bar_timestamp >= end_time) {
            continue;
        }

        Core::Bar parsed_bar(bar_timestamp, json_to_double(bar_json.at("o")), json_to_double(bar_json.at("h")),
                             json_to_double(bar_json.at("l")), json_to_double(bar_json.at("c")),
                             bar_json.contains("v") ? json_to_double(bar_json["v"]) : 0.0);
        if (!std::isfinite(parsed_bar.open_price) || !std::isfinite(parsed_bar.high_price) ||
            !std::isfinite(parsed_bar.low_price) || !std::isfinite(parsed_bar.close_price)) {
            continue;
        }
        parsed_bars.push_back(parsed_bar);
    }

    std::sort(parsed_bars.begin(), parsed_bars.end(),
              [](const Core::Bar& left_bar, const Core::Bar& right_bar) { return left_bar.timestamp < right_bar.timestamp; });
    if (max_count > 0 && parsed_bars.size() > static_cast<size_t>(max_count)) {
        parsed_bars.erase(parsed_bars.begin(), parsed_bars.end() - max_count);
    }
    return parsed_bars;
}

std::vector<Core::Position> parse_positions_response(const std::string& response_body) {
    json positions_json = parse_body(response_body, "positions");
    std::vector<Core::Position> positions;
    if (!positions_json.is_array()) {
        return positions;
    }

    for (const auto& position_json : positions_json) {
        std::string ticker = string_field(position_json, "ticker");
        if (ticker.empty()) {
            ticker = string_field(position_json, "contractDesc");
        }
        if (ticker.empty() || !position_json.contains("position")) {
            continue;
        }
        double position_quantity = json_to_double(position_json["position"]);
        if (position_quantity == 0.0) {
            continue;
        }
        double average_cost = position_json.contains("avgCost") ? json_to_double(position_json["avgCost"]) : 0.0;
        positions.emplace_back(make_instrument_key(string_field(position_json, "listingExchange"), ticker),
                               position_quantity, average_cost);
    }
    return positions;
}

std::vector<Core::Order> parse_orders_response(const std::string& response_body) {
    json orders_json = parse_body(response_body, "orders");
    std::vector<Core::Order> orders;
    if (!orders_json.contains("orders") || !orders_json["orders"].is_array()) {
        return orders;
    }

    for (const auto& order_json : orders_json["orders"]) {
        Core::Order order;
        order.order_id = string_field(order_json, "orderId");
        order.instrument_key = make_instrument_key(string_field(order_json, "listingExchange"), string_field(order_json, "ticker"));
        order.side = to_upper(string_field(order_json, "side")) == "BUY" ? Core::OrderSide::BUY : Core::OrderSide::SELL;
        if (order_json.contains("remainingQuantity")) {
            order.quantity = json_to_double(order_json["remainingQuantity"]);
        } else if (order_json.contains("totalSize")) {
            order.quantity = json_to_double(order_json["totalSize"]);
        }
        order.status = string_field(order_json, "status");
        orders.push_back(order);
    }
    return orders;
}

OrderSubmissionReply parse_order_submission_response(const std::string& response_body) {
    json submission_json = parse_body(response_body, "order submission");
    OrderSubmissionReply submission_reply;

    if (submission_json.is_object() && submission_json.contains("error")) {
        submission_reply.error_message = json_to_string(submission_json["error"]);
        return submission_reply;
    }
    if (!submission_json.is_array() || submission_json.empty()) {
        submission_reply.error_message = "Unexpected order submission response";
        return submission_reply;
    }

    const json& first_entry = submission_json.front();
    std::string order_id = string_field(first_entry, "order_id");
    if (!order_id.empty()) {
        submission_reply.order_id = order_id;
        submission_reply.order_status = string_field(first_entry, "order_status");
        return submission_reply;
    }

    std::string reply_id = string_field(first_entry, "id");
    if (!reply_id.empty()) {
        submission_reply.confirmation_reply_id = reply_id;
        if (first_entry.contains("message") && first_entry["message"].is_array()) {
            for (const auto& message_json : first_entry["message"]) {
                submission_reply.messages.push_back(json_to_string(message_json));
            }
        }
        return submission_reply;
    }

    submission_reply.error_message = "Order submission response carried neither an order id nor a reply id";
    return submission_reply;
}

std::string build_order_payload(const std::string& conid, Core::OrderSide side, double quantity, bool outside_regular_trading_hours) {
    json order_json;
    order_json["conid"] = std::stoll(conid);
    order_json["orderType"] = "MKT";
    order_json["side"] = Core::order_side_to_string(side);
    order_json["quantity"] = quantity;
    order_json["tif"] = "DAY";
    order_json["outsideRTH"] = outside_regular_trading_hours;

    json payload_json;
    payload_json["orders"] = json::array({order_json});
    return payload_json.dump();
}

std::string history_bar_size(Core::Granularity granularity) {
    switch (granularity) {
        case Core::Granularity::HALF_HOUR:
            return "30min";
        case Core::Granularity::HOUR:
            return "1h";
        case Core::Granularity::DAY:
            return "1d";
    }
    return "1d";
}

std::string history_period(Core::Granularity granularity, int max_count) {
    int bar_count = std::max(1, max_count);
    int calendar_days = 0;
    switch (granularity) {
        case Core::Granularity::HALF_HOUR:
            calendar_days = (bar_count + 12) / 13;
            break;
        case Core::Granularity::HOUR:
            calendar_days = (bar_count + 6) / 7;
            break;
        case Core::Granularity::DAY:
            calendar_days = bar_count;
            break;
    }
    // Trading days to calendar days, plus room for holidays.
    calendar_days = calendar_days * 7 / 5 + 4;
    return std::to_string(calendar_days) + "d";
}

std::string make_instrument_key(const std::string& exchange, const std::string& ticker) {
    if (exchange.empty()) {
        return to_upper(ticker);
    }
    return to_upper(exchange) + ":" + to_upper(ticker);
}

} // namespace API
} // namespace SellManager
