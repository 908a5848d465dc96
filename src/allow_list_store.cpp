#include "allow_list_store.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace pt = boost::property_tree;

namespace relay_guard {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// ptree cannot emit a top-level array, so the list is written by hand. Entries
// only ever hold canonical CIDR text; quotes and backslashes are escaped anyway.
std::string render_json_array(const std::vector<std::string>& entries) {
    std::string out = "[";
    for (std::size_t i = 0; i < entries.size(); ++i) {
        out += i == 0 ? "\n" : ",\n";
        out += "  \"";
        for (char c : entries[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += "\"";
    }
    out += entries.empty() ? "]\n" : "\n]\n";
    return out;
}

} // namespace

JsonAllowListStore::JsonAllowListStore(std::string path)
    : path_(std::move(path)) {}

std::vector<std::string> JsonAllowListStore::load(std::ostream& log) {
    std::vector<std::string> entries;
    std::ifstream in(path_);
    if (!in) {
        log << "[store] No allow-list at " << path_ << ", starting empty.\n";
        return entries;
    }

    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const std::exception& ex) {
        log << "[store] Error loading allowed IPs from " << path_ << ": " << ex.what() << "\n";
        return entries;
    }

    // A JSON array parses into children with empty keys. Anything else is not
    // an allow-list.
    if (!tree.data().empty() || tree.count("") != tree.size()) {
        log << "[store] Error loading allowed IPs from " << path_ << ": expected an array of strings\n";
        return entries;
    }
    for (const auto& item : tree) {
        if (!item.second.empty()) {
            log << "[store] Error loading allowed IPs from " << path_ << ": nested value in array\n";
            return {};
        }
        entries.push_back(trim(item.second.data()));
    }
    return entries;
}

void JsonAllowListStore::save(const std::vector<std::string>& entries) {
    namespace fs = std::filesystem;
    const fs::path target(path_);
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        }
        out << render_json_array(entries);
        out.flush();
        if (!out) {
            throw std::runtime_error("write error on " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("cannot replace " + target.string() + ": " + ec.message());
    }
}

} // namespace relay_guard
