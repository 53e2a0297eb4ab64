// JSON parsing and serialization utilities
#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mev {

// ============================================================================
// JSON value parsing (boost::json::value -> T)
// ============================================================================

// Parse a JSON value as u64: unsigned/non-negative integer or decimal string
inline uint64_t parse_u64(const boost::json::value& v, const char* key) {
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64()) {
        if (v.as_int64() < 0) {
            throw std::runtime_error(std::string("negative value for key: ") + key);
        }
        return static_cast<uint64_t>(v.as_int64());
    }
    if (v.is_string()) {
        const std::string s(v.as_string().c_str());
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error(std::string("expected decimal string for key: ") + key);
        }
        try {
            return static_cast<uint64_t>(std::stoull(s));
        } catch (const std::out_of_range&) {
            throw std::runtime_error(std::string("value out of range for key: ") + key);
        }
    }
    throw std::runtime_error(std::string("expected integer for key: ") + key);
}

// Parse a JSON value as a plain real number
inline double parse_real(const boost::json::value& v, const char* key) {
    if (v.is_double()) return v.as_double();
    if (v.is_int64())  return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    if (v.is_string()) {
        try {
            return std::stod(std::string(v.as_string().c_str()));
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("expected number for key: ") + key);
        }
    }
    throw std::runtime_error(std::string("expected number for key: ") + key);
}

// ============================================================================
// JSON object accessors
// ============================================================================

// Get an optional uint64 value from a JSON object (returns default if missing)
inline uint64_t get_u64_opt(const boost::json::object& obj, const char* key, uint64_t default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    return parse_u64(it->value(), key);
}

// Narrowing variant for u16 fields (fee, slippage)
inline uint16_t get_u16_opt(const boost::json::object& obj, const char* key, uint16_t default_value) {
    const uint64_t v = get_u64_opt(obj, key, default_value);
    if (v > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error(std::string("value out of range for key: ") + key);
    }
    return static_cast<uint16_t>(v);
}

inline double get_real_opt(const boost::json::object& obj, const char* key, double default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    return parse_real(it->value(), key);
}

inline bool get_bool_opt(const boost::json::object& obj, const char* key, bool default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    if (!it->value().is_bool()) {
        throw std::runtime_error(std::string("expected bool for key: ") + key);
    }
    return it->value().as_bool();
}

inline std::string get_str_opt(const boost::json::object& obj, const char* key, const std::string& default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    if (!it->value().is_string()) {
        throw std::runtime_error(std::string("expected string for key: ") + key);
    }
    return std::string(it->value().as_string().c_str());
}

// ============================================================================
// File I/O
// ============================================================================

// Read entire file contents into a string
inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace mev
