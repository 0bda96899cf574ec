// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"

#include <string>
#include <fstream>
#include <type_traits>
#include "lib.hpp"
#include "logger.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;


// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string; logs and returns false on a parse error.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            migrator::logger()->error("JSON Parse Error: {} at offset {}",
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Parse a JSON file; logs and returns false if unreadable or malformed.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            migrator::logger()->error("Failed to open file: {}", file_path);
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            migrator::logger()->error("JSON Parse Error in file {}: {} at offset {}", file_path,
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Helper function to stringify a RapidJSON Value into a std::string.
    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    inline bool has(const rapidjson::Value& parent, const std::string& key) {
        return parent.IsObject() && parent.HasMember(key.c_str());
    }

    // Template helper to get a value from a RapidJSON Value/Document.
    // It returns a default value if the key is not found or the type is incorrect.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!has(parent, key)) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        }
        return default_value;
    }

    // Template helper to set a value in a RapidJSON object.
    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, rapidjson::Document::AllocatorType& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(value.c_str(), allocator).Move(),
                             allocator);
        } else {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             value,
                             allocator);
        }
    }

} // namespace jhlp
