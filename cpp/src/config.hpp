#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "nanakshahi.hpp"

namespace config {

// Flat settings from a TOML-ish file. Keys under a [section] header are
// stored as "section.key"; keys before any header keep their bare name.
using Settings = std::map<std::string, std::string>;

// Missing or unreadable file yields an empty map. Lines without '=' are skipped.
Settings read_settings(const std::filesystem::path& p);

// en|english|latin -> English, pa|punjabi|gurmukhi -> Punjabi (case-insensitive)
std::optional<nanakshahi::Language> parse_language(const std::string& value);

struct Options {
    nanakshahi::Language language = nanakshahi::Language::English;
};

// Looks up `display.language`, then top-level `language`. Never throws;
// unknown values fall back to English with a warning on stderr.
Options load_options(const std::filesystem::path& p);
Options load_default_options();

// Conversions with the month name written in the configured script.
nanakshahi::NanakshahiDate to_nanakshahi(const Options& opts, int year, int month, int day);
nanakshahi::NanakshahiDate today(const Options& opts);

} // namespace config
