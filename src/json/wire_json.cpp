#include "mcpmux/json/wire_json.hpp"

namespace mcpmux {

WireDecodeResult WireDecoder::decode(std::string_view text) {
    simdjson::padded_string padded(text);
    simdjson::dom::element root;
    const auto error = parser_.parse(padded).get(root);
    if (error != simdjson::SUCCESS) {
        return tl::unexpected(WireDecodeError{simdjson::error_message(error)});
    }
    return convert(root, 0);
}

WireDecodeResult WireDecoder::convert(simdjson::dom::element element, std::size_t depth) {
    if (depth > kMaxDepth) {
        return tl::unexpected(WireDecodeError{
            "maximum nesting depth exceeded (" + std::to_string(kMaxDepth) + ")"});
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            nlohmann::json object = nlohmann::json::object();
            for (auto field : simdjson::dom::object(element)) {
                auto child = convert(field.value, depth + 1);
                if (!child) {
                    return child;
                }
                object[std::string(field.key)] = std::move(*child);
            }
            return object;
        }
        case simdjson::dom::element_type::ARRAY: {
            nlohmann::json array = nlohmann::json::array();
            for (auto item : simdjson::dom::array(element)) {
                auto child = convert(item, depth + 1);
                if (!child) {
                    return child;
                }
                array.push_back(std::move(*child));
            }
            return array;
        }
        case simdjson::dom::element_type::STRING:
            return nlohmann::json(std::string(std::string_view(element)));
        case simdjson::dom::element_type::INT64:
            return nlohmann::json(std::int64_t(element));
        case simdjson::dom::element_type::UINT64:
            return nlohmann::json(std::uint64_t(element));
        case simdjson::dom::element_type::DOUBLE:
            return nlohmann::json(double(element));
        case simdjson::dom::element_type::BOOL:
            return nlohmann::json(bool(element));
        case simdjson::dom::element_type::NULL_VALUE:
            return nlohmann::json(nullptr);
    }
    return tl::unexpected(WireDecodeError{"unsupported JSON element type"});
}

bool looks_like_json_object(std::string_view line) noexcept {
    const auto first = line.find_first_not_of(" \t\r");
    return first != std::string_view::npos && line[first] == '{';
}

}  // namespace mcpmux
