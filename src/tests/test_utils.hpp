#ifndef CIRRUS_TEST_UTILS_HPP
#define CIRRUS_TEST_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

// Set logging severity level and configure logging
inline void init_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::warning
    );

    boost::log::add_common_attributes();
}

// Deterministic, non-repeating filler so misplaced bytes show up
inline std::string make_payload(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 131 + i / 251) & 0xff);
    }
    return data;
}

inline std::vector<uint8_t> make_index(uint8_t seed) {
    std::vector<uint8_t> index(32);
    for (std::size_t i = 0; i < index.size(); ++i) {
        index[i] = static_cast<uint8_t>(seed + i);
    }
    return index;
}

inline const std::string TEST_BUCKET = "6f5e2d1c0b0a09080706050403020100";
inline const std::string TEST_SECRET =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

#endif // CIRRUS_TEST_UTILS_HPP
