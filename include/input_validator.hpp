#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace namesys {

// Input checks applied to untrusted names, values and wire payloads.
class InputValidator {
public:
    static constexpr size_t MAX_KEY_NAME_LENGTH = 64;
    static constexpr size_t MAX_VALUE_LENGTH = 2048;

    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;
        
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }
    
    // Safe alphanumeric characters (including underscores and hyphens).
    static bool is_valid_alphanumeric(const std::string& str) {
        if (str.empty()) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        });
    }

    static bool is_valid_key_name(const std::string& name) {
        return name.size() <= MAX_KEY_NAME_LENGTH && is_valid_alphanumeric(name);
    }

    // A record value is an absolute path of printable characters, e.g. /ipfs/Qm...
    static bool is_valid_value_path(const std::string& value) {
        if (value.size() < 2 || value.size() > MAX_VALUE_LENGTH || value[0] != '/') return false;
        return std::all_of(value.begin(), value.end(), [](char c) {
            return std::isgraph(static_cast<unsigned char>(c));
        });
    }
    
    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with recursion depth limits to prevent stack-exhaustion.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 8; 
        return boost::json::parse(input, {}, opt);
    }
};

}
