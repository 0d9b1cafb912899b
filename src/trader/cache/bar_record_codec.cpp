#include "bar_record_codec.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace SellManager {
namespace Core {

std::string encode_bar_record(const Bar& bar) {
    json bar_record = {
        {"t", bar.timestamp},
        {"date", TimeUtils::format_epoch_iso_utc(bar.timestamp)},
        {"o", bar.open_price},
        {"h", bar.high_price},
        {"l", bar.low_price},
        {"c", bar.close_price},
        {"v", bar.volume}
    };
    return bar_record.dump();
}

std::optional<Bar> decode_bar_record(const std::string& record_line) {
    json bar_record = json::parse(record_line, nullptr, false);
    if (bar_record.is_discarded() || !bar_record.is_object()) {
        return std::nullopt;
    }
    const char* required_fields[] = {"t", "o", "h", "l", "c", "v"};
    for (const char* field_name : required_fields) {
        auto field_iterator = bar_record.find(field_name);
        if (field_iterator == bar_record.end() || !field_iterator->is_number()) {
            return std::nullopt;
        }
    }
    if (!bar_record["t"].is_number_integer()) {
        return std::nullopt;
    }

    Bar decoded_bar(bar_record["t"].get<long long>(),
                    bar_record["o"].get<double>(),
                    bar_record["h"].get<double>(),
                    bar_record["l"].get<double>(),
                    bar_record["c"].get<double>(),
                    bar_record["v"].get<double>());
    if (!std::isfinite(decoded_bar.close_price) || !std::isfinite(decoded_bar.open_price)) {
        return std::nullopt;
    }
    return decoded_bar;
}

std::string cache_key_to_file_stem(const std::string& cache_key) {
    std::string file_stem;
    file_stem.reserve(cache_key.size() + 8);
    for (char key_character : cache_key) {
        if (key_character == ':') {
            file_stem += "__";
        } else if (key_character == '/' || key_character == '\\') {
            file_stem += '_';
        } else {
            file_stem += key_character;
        }
    }
    return file_stem;
}

} // namespace Core
} // namespace SellManager
