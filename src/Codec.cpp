/**
 * @file Codec.cpp
 * @brief Implementation of the JSON document codec
 */

#include "treelink/Codec.hpp"
#include "treelink/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace treelink {

namespace {

    std::string read_file(const std::string& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw FileNotFoundError(path);
        }
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw FileNotFoundError(path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    void expect(bool ok, const std::string& source, const std::string& what) {
        if (!ok) throw ParseError(source, what);
    }

} // anonymous namespace

NodePtr node_from_json(const Value& j, const std::string& source) {
    expect(j.is_object(), source, "node must be an object, got " + type_name(j));

    auto tag = j.find("tag");
    expect(tag != j.end() && tag->is_string(), source, "node without a string \"tag\"");
    const std::string tag_text = tag->get<std::string>();
    expect(!tag_text.empty(), source, "empty \"tag\"");

    NodePtr node = make_node(tag_text);

    if (auto text = j.find("text"); text != j.end()) {
        expect(text->is_string(), source, "\"text\" of " + tag_text + " must be a string");
        node->set_text(text->get<std::string>());
    }

    if (auto attrs = j.find("attributes"); attrs != j.end()) {
        expect(attrs->is_object(), source, "\"attributes\" of " + tag_text + " must be an object");
        for (auto it = attrs->begin(); it != attrs->end(); ++it) {
            expect(it.value().is_string(), source,
                   "attribute '" + it.key() + "' of " + tag_text + " must be a string");
            node->set_attribute(it.key(), it.value().get<std::string>());
        }
    }

    if (auto children = j.find("children"); children != j.end()) {
        expect(children->is_array(), source, "\"children\" of " + tag_text + " must be an array");
        for (const auto& c : *children) {
            node->append_child(node_from_json(c, source));
        }
    }

    return node;
}

Value node_to_json(const Node& node) {
    Value j = Value::object();
    j["tag"] = node.tag();
    if (!node.attributes().empty()) {
        j["attributes"] = node.attributes();
    }
    if (!node.text().empty()) {
        j["text"] = node.text();
    }
    if (node.child_count() > 0) {
        Value children = Value::array();
        for (const auto& c : node.children()) {
            children.push_back(node_to_json(*c));
        }
        j["children"] = std::move(children);
    }
    return j;
}

Document load_document(const std::string& path) {
    const std::string content = read_file(path);

    Value j;
    try {
        j = Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, e.what());
    }

    return Document(node_from_json(j, path), path);
}

void save_document(const Document& doc, const std::string& path, int indent) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TreelinkError("Cannot write to " + path);
    }
    out << node_to_json(doc.root()).dump(indent) << '\n';
    if (!out) {
        throw TreelinkError("Failed writing " + path);
    }
}

} // namespace treelink
