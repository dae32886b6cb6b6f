#include "config.hpp"
#include "platform.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace config {

static std::string trim(const std::string& s){
    auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);});
    auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);}).base();
    if (l >= r) return "";
    return std::string(l, r);
}

static std::string lower(std::string s){
    for (char &c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// A '#' inside a quoted value is kept.
static std::string strip_comment(const std::string& line){
    char quote = 0;
    for (size_t i=0;i<line.size();i++){
        char c = line[i];
        if (quote) { if (c == quote) quote = 0; }
        else if (c == '"' || c == '\'') quote = c;
        else if (c == '#') return line.substr(0, i);
    }
    return line;
}

static std::string unquote(const std::string& v){
    if (v.size() >= 2 && (v.front()=='"' || v.front()=='\'') && v.back()==v.front())
        return v.substr(1, v.size()-2);
    return v;
}

Settings read_settings(const fs::path& p){
    Settings out;
    std::ifstream in(p);
    if (!in) return out;
    std::string section, raw;
    while (std::getline(in, raw)){
        std::string line = trim(strip_comment(raw));
        if (line.empty()) continue;
        if (line.front() == '[') {
            auto close = line.find(']');
            section = trim(line.substr(1, close == std::string::npos ? std::string::npos : close - 1));
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) continue;
        if (!section.empty()) key = section + "." + key;
        out[key] = unquote(trim(line.substr(eq + 1)));
    }
    return out;
}

std::optional<nanakshahi::Language> parse_language(const std::string& value){
    std::string v = lower(trim(value));
    if (v == "en" || v == "english" || v == "latin") return nanakshahi::Language::English;
    if (v == "pa" || v == "punjabi" || v == "gurmukhi") return nanakshahi::Language::Punjabi;
    return std::nullopt;
}

Options load_options(const fs::path& p){
    Options opts;
    Settings s = read_settings(p);
    auto it = s.find("display.language");
    if (it == s.end()) it = s.find("language");
    if (it == s.end() || it->second.empty()) return opts;
    if (auto lang = parse_language(it->second)) opts.language = *lang;
    else std::cerr << "nanakshahi: warning: unknown language \"" << it->second << "\" in " << p.string() << ", using en\n";
    return opts;
}

Options load_default_options(){
    return load_options(platform::resolve_config_path());
}

nanakshahi::NanakshahiDate to_nanakshahi(const Options& opts, int year, int month, int day){
    return nanakshahi::to_nanakshahi(year, month, day, opts.language);
}

nanakshahi::NanakshahiDate today(const Options& opts){
    return nanakshahi::today(opts.language);
}

} // namespace config
