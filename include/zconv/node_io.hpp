#pragma once
#include "json.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zconv {

// ---------------------------------------------------------------------------
// Attributes of an on-disk Zarr node
//
//   v3: "attributes" member of <node>/zarr.json
//   v2: <node>/.zattrs
// ---------------------------------------------------------------------------

namespace io_detail {

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary | std::ios::ate);
    if (!f) throw std::runtime_error("zconv: cannot open file: " + p.string());
    auto sz = f.tellg();
    f.seekg(0);
    std::string buf(static_cast<std::size_t>(sz), '\0');
    if (!f.read(buf.data(), sz))
        throw std::runtime_error("zconv: cannot read file: " + p.string());
    return buf;
}

inline void write_file(const std::filesystem::path& p, std::string_view data) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("zconv: cannot write file: " + p.string());
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!f) throw std::runtime_error("zconv: short write: " + p.string());
}

inline JsonValue read_json(const std::filesystem::path& p) {
    try {
        return json_parse(read_file(p));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(p.string() + ": " + e.what());
    }
}

} // namespace io_detail

/// The node's attributes, or an empty object when it has none.
[[nodiscard]] inline JsonValue read_node_attributes(const std::filesystem::path& node) {
    auto zarr_json = node / "zarr.json";
    if (std::filesystem::exists(zarr_json)) {
        auto root = io_detail::read_json(zarr_json);
        if (!root.is_object())
            throw std::runtime_error("zconv: zarr.json root must be a JSON object: " + zarr_json.string());
        if (auto* p = root.find("attributes")) return *p;
        return JsonValue{JsonObject{}};
    }
    auto zattrs = node / ".zattrs";
    if (std::filesystem::exists(zattrs)) return io_detail::read_json(zattrs);
    return JsonValue{JsonObject{}};
}

/// v3 nodes get their zarr.json "attributes" replaced; anything else is
/// written as a v2 .zattrs file.
inline void write_node_attributes(const std::filesystem::path& node, const JsonValue& attributes) {
    if (!attributes.is_object())
        throw std::runtime_error("zconv: node attributes must be a JSON object");

    auto zarr_json = node / "zarr.json";
    if (std::filesystem::exists(zarr_json)) {
        auto root = io_detail::read_json(zarr_json);
        if (!root.is_object())
            throw std::runtime_error("zconv: zarr.json root must be a JSON object: " + zarr_json.string());
        root.as_object().insert_or_assign("attributes", attributes);
        io_detail::write_file(zarr_json, json_serialize(root, 2) + "\n");
        return;
    }
    io_detail::write_file(node / ".zattrs", json_serialize(attributes, 2) + "\n");
}

} // namespace zconv
