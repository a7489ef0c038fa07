// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <rapidjson/encodings.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "exception.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "object.hpp"
#include "object_type.hpp"

namespace piiredact {

namespace {

struct string_view_stream {
    using Ch = std::string_view::value_type;

    explicit string_view_stream(std::string_view str) : src(str) {}

    [[nodiscard]] char Peek() const
    {
        if (idx < src.size()) [[likely]] {
            return src[idx];
        }
        return '\0';
    }
    char Take()
    {
        if (idx < src.size()) [[likely]] {
            return src[idx++];
        }
        return '\0';
    }
    [[nodiscard]] size_t Tell() const { return idx; }

    static char *PutBegin()
    {
        assert(false);
        return nullptr;
    }
    static void Put(Ch /*unused*/) { assert(false); }
    static void Flush() { assert(false); }
    static size_t PutEnd(Ch * /*unused*/)
    {
        assert(false);
        return 0;
    }

    std::string_view src;
    std::size_t idx{0};
};

class object_reader_handler
    : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, object_reader_handler> {
public:
    explicit object_reader_handler(std::size_t max_depth) : max_depth_(max_depth) {}
    ~object_reader_handler() = default;
    object_reader_handler(object_reader_handler &&) = delete;
    object_reader_handler(const object_reader_handler &) = delete;
    object_reader_handler &operator=(object_reader_handler &&) = delete;
    object_reader_handler &operator=(const object_reader_handler &) = delete;

    bool Null() { return emplace(owned_object::make_null()); }
    bool Bool(bool b) { return emplace(owned_object::make_boolean(b)); }
    bool Int(int i) { return emplace(owned_object::make_signed(i)); }
    bool Uint(unsigned u) { return emplace(owned_object::make_unsigned(u)); }
    bool Int64(int64_t i) { return emplace(owned_object::make_signed(i)); }
    bool Uint64(uint64_t u) { return emplace(owned_object::make_unsigned(u)); }
    bool Double(double d) { return emplace(owned_object::make_float(d)); }

    bool String(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        return emplace(owned_object::make_string({str, length}));
    }

    bool Key(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        key_.assign(str, length);
        return true;
    }

    bool StartObject() { return emplace(owned_object::make_map()); }

    bool EndObject(rapidjson::SizeType /*memberCount*/)
    {
        assert(!stack_.empty());
        stack_.pop_back();
        return true;
    }

    bool StartArray() { return emplace(owned_object::make_array()); }

    bool EndArray(rapidjson::SizeType /*elementCount*/)
    {
        assert(!stack_.empty());
        stack_.pop_back();
        return true;
    }

    owned_object finalize()
    {
        stack_.clear();
        return std::move(root_);
    }

    [[nodiscard]] bool depth_exceeded() const noexcept { return depth_exceeded_; }

private:
    // Each open map keeps an index of its keys, so that duplicates can be
    // replaced in place without scanning the map.
    struct container_frame {
        owned_object *container;
        std::unordered_map<std::string, std::size_t> keys;
    };

    owned_object &emplace_in_map(container_frame &frame, owned_object &&object)
    {
        auto &map = *frame.container;
        auto [it, inserted] = frame.keys.try_emplace(key_, map.size());
        if (!inserted) {
            auto &slot = map.at(it->second);
            slot = std::move(object);
            return slot;
        }
        return map.emplace_back(key_, std::move(object));
    }

    bool emplace(owned_object &&object)
    {
        try {
            owned_object *slot = nullptr;
            if (stack_.empty()) {
                root_ = std::move(object);
                slot = &root_;
            } else {
                auto &frame = stack_.back();
                slot = frame.container->is_map() ? &emplace_in_map(frame, std::move(object))
                                                 : &frame.container->emplace_back(std::move(object));
            }

            if (slot->is_container()) {
                if (stack_.size() >= max_depth_) {
                    depth_exceeded_ = true;
                    return false;
                }
                // Siblings are only added once this container has been closed,
                // so the pointer remains valid while on the stack.
                stack_.push_back({slot, {}});
            }
        } catch (const std::exception &e) {
            PIIREDACT_ERROR("failed to decode JSON value: {}", e.what());
            return false;
        }

        return true;
    }

    std::size_t max_depth_;
    owned_object root_;
    std::vector<container_frame> stack_;
    std::string key_;
    bool depth_exceeded_{false};
};

template <typename Writer>
// NOLINTNEXTLINE(misc-no-recursion, google-runtime-references)
void object_to_json_helper(const owned_object &obj, Writer &writer, std::vector<std::string> &path)
{
    switch (obj.type()) {
    case object_type::null:
        writer.Null();
        break;
    case object_type::boolean:
        writer.Bool(obj.as<bool>());
        break;
    case object_type::int64:
        writer.Int64(obj.as<int64_t>());
        break;
    case object_type::uint64:
        writer.Uint64(obj.as<uint64_t>());
        break;
    case object_type::float64: {
        auto value = obj.as<double>();
        if (std::isfinite(value)) {
            writer.Double(value);
        } else {
            writer.Null();
        }
        break;
    }
    case object_type::string: {
        auto str = obj.as<std::string_view>();
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
        break;
    }
    case object_type::array:
        writer.StartArray();
        for (std::size_t i = 0; i < obj.size(); ++i) {
            path.emplace_back(std::to_string(i));
            object_to_json_helper(obj.at(i), writer, path);
            path.pop_back();
        }
        writer.EndArray();
        break;
    case object_type::map:
        writer.StartObject();
        for (std::size_t i = 0; i < obj.size(); ++i) {
            auto key = obj.key_at(i);
            writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
            path.emplace_back(key);
            object_to_json_helper(obj.at(i), writer, path);
            path.pop_back();
        }
        writer.EndObject();
        break;
    case object_type::invalid:
    default: {
        std::string path_str;
        for (const auto &key : path) {
            if (!path_str.empty()) {
                path_str.append(".");
            }
            path_str.append(key);
        }
        throw invalid_object(path_str);
    }
    }
}

} // namespace

owned_object json_to_object(std::string_view json, std::size_t max_depth)
{
    object_reader_handler handler{max_depth};
    string_view_stream ss(json);

    rapidjson::Reader reader;
    const rapidjson::ParseResult res = reader.Parse<rapidjson::kParseIterativeFlag>(ss, handler);
    if (res.IsError()) {
        if (handler.depth_exceeded()) {
            throw parsing_error(fmt::format("JSON nested deeper than {} levels", max_depth));
        }

        // Not interested in partial JSON
        throw parsing_error(fmt::format(
            "invalid JSON at offset {}: {}", res.Offset(), rapidjson::GetParseError_En(res.Code())));
    }

    return handler.finalize();
}

std::string object_to_json(const owned_object &obj, bool pretty)
{
    rapidjson::StringBuffer buffer;
    std::vector<std::string> path;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        object_to_json_helper(obj, writer, path);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        object_to_json_helper(obj, writer, path);
    }

    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace piiredact
