#include "ztredact/gazetteer.h"

#include "ztredact/errors.h"
#include "ztredact/text_util.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ztredact {

void Gazetteer::add(const std::string &value, EntityKind kind) {
    std::string v = collapse_spaces(trim_copy(value));
    if (v.empty()) return;
    for (auto &e : entries_) if (e.value == v && e.kind == kind) return;
    entries_.push_back({v, kind});
}

void Gazetteer::merge(const Gazetteer &other) {
    for (auto &e : other.entries_) add(e.value, e.kind);
}

static EntityKind kind_or_throw(const std::string &s, const std::string &path) {
    EntityKind k;
    if (!parse_entity_kind(s, k)) throw ConfigError("gazetteer " + path + ": unknown entity kind " + s);
    return k;
}

Gazetteer Gazetteer::load(const std::string &path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open gazetteer: " + path);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    Gazetteer g;
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    if (ext == ".json") {
        try {
            json j = json::parse(content);
            for (auto &el : j) {
                if (el.is_string()) g.add(el.get<std::string>());
                else g.add(el.at("value").get<std::string>(),
                           kind_or_throw(el.value("kind", std::string("PERSON")), path));
            }
        } catch (const json::exception &e) {
            throw ConfigError("gazetteer " + path + ": " + e.what());
        }
        return g;
    }

    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') continue;
        size_t tab = line.find('\t');
        if (tab == std::string::npos) g.add(line);
        else g.add(line.substr(tab + 1), kind_or_throw(trim_copy(line.substr(0, tab)), path));
    }
    return g;
}

} // namespace ztredact
