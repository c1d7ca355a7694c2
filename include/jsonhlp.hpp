// jsonhelper.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/error/en.h"

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <fstream>
#include <type_traits>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;


// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a Document. Logs and returns false on a parse error.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            LOG_ERROR("JSON Parse Error: %s at offset %zu",
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Parse a JSON file into a Document.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            LOG_ERROR("Failed to open file: %s", file_path.c_str());
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            LOG_ERROR("JSON Parse Error in file %s: %s at offset %zu", file_path.c_str(),
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

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

    // Utility to convert any scalar Value to string
    inline std::string val2str(const rapidjson::Value& value) {
        if (value.IsString()) return value.GetString();
        if (value.IsBool()) return value.GetBool() ? "true" : "false";
        if (value.IsNull()) return "null";
        return stringify(value); // numbers, objects, arrays
    }

    // Typed member lookup: returns default_value when the key is missing or the type differs.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber() || val.IsBool()) return val2str(val);
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>){
            if (val.IsNumber()) return val.GetDouble();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        }
        return default_value;
    }

    // Integer member that may be absent; a present non-integer value is a config error.
    inline std::optional<int> get_opt_int(const rapidjson::Value& parent, const std::string& key) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return std::nullopt;
        const jval& val = parent.FindMember(key.c_str())->value;
        if (val.IsNull()) return std::nullopt;
        if (!val.IsInt()) THROW("'%s' must be an integer", key.c_str());
        return val.GetInt();
    }

    // Array of scalars -> strings. Missing key gives an empty list.
    inline std::vector<std::string> get_strings(const rapidjson::Value& parent, const std::string& key) {
        std::vector<std::string> out;
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return out;
        const jval& arr = parent.FindMember(key.c_str())->value;
        if (!arr.IsArray()) THROW("'%s' must be an array", key.c_str());
        for (const auto& el : arr.GetArray()) out.push_back(val2str(el));
        return out;
    }

    // Object of scalars -> ordered key/value pairs (document order).
    inline kv_list get_pairs(const rapidjson::Value& parent, const std::string& key) {
        kv_list out;
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return out;
        const jval& obj = parent.FindMember(key.c_str())->value;
        if (!obj.IsObject()) THROW("'%s' must be an object", key.c_str());
        for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
            out.emplace_back(it->name.GetString(), val2str(it->value));
        }
        return out;
    }

    // Overload for setting values in a nested object.
    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, jdaloc& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(value.c_str(), allocator).Move(),
                             allocator);
        } else if constexpr (std::is_same_v<T, size_t>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(static_cast<uint64_t>(value)).Move(),
                             allocator);
        } else {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             value,
                             allocator);
        }
    }

    inline void set_strings(rapidjson::Value& parent, const std::string& key, const std::vector<std::string>& values, jdaloc& allocator) {
        jval arr(rapidjson::kArrayType);
        for (const auto& v : values) {
            arr.PushBack(rapidjson::Value(v.c_str(), allocator).Move(), allocator);
        }
        parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(), arr, allocator);
    }

} // namespace jhlp
