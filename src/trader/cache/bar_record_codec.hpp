#ifndef BAR_RECORD_CODEC_HPP
#define BAR_RECORD_CODEC_HPP

#include <optional>
#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

// One cached bar per line: {"t":<epoch s>,"date":"<iso utc>","o":..,"h":..,"l":..,"c":..,"v":..}
std::string encode_bar_record(const Bar& bar);

// nullopt when the line is not a well-formed bar record.
std::optional<Bar> decode_bar_record(const std::string& record_line);

// Filesystem-safe file stem for a cache key ("NASDAQ:AAPL:30m" -> "NASDAQ__AAPL__30m").
std::string cache_key_to_file_stem(const std::string& cache_key);

} // namespace Core
} // namespace SellManager

#endif // BAR_RECORD_CODEC_HPP
