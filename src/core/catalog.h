#pragma once
#include <string>
#include <vector>

// Built-in leftover catalogs.
// Extension groups, complete filenames and keyword groups, each tagged with
// the leftover category it reveals. The catalog is immutable; scan levels
// select nested slices of it.

enum class Language {
    EN,
    PT_BR,
    ALL
};

/**
 * @brief Parse a language filter name ("en", "pt-br", "all")
 * @return false for unknown names
 */
bool parse_language(const std::string& name, Language& out);

std::string language_name(Language lang);

struct CatalogEntry {
    std::string value;
    std::string category;
};

// What one scan level probes.
struct LevelSelection {
    std::vector<CatalogEntry> files;       // complete filenames, critical first
    std::vector<CatalogEntry> extensions;  // extension sweep set, ordered
    std::vector<std::string> words;        // brute-force keywords after language filtering
};

class Catalog {
public:
    static constexpr int kMaxLevel = 4;

    /// The process-wide built-in catalog.
    static const Catalog& builtin();

    /**
     * @brief Select the candidate material for a scan level
     * @param level 0 (critical only) to 4 (exhaustive)
     * @param lang Keyword language filter
     * @return Selection where every list is a superset of the level below
     */
    LevelSelection for_level(int level, Language lang) const;

    /**
     * @brief Look up the category of an extension (e.g. "php.bak" -> "source")
     * @return Category name, "generic" when the extension is not catalogued
     */
    std::string category_of(const std::string& extension) const;

    /// Suffixes combined with domain-derived tokens.
    std::vector<std::string> domain_suffixes() const;

    /// True for names in the critical filename list.
    bool is_critical_file(const std::string& name) const;

private:
    enum class WordLang { NEUTRAL, EN, PT_BR };

    struct Group {
        std::string name;
        std::string category;
        std::vector<std::string> values;
    };

    struct WordGroup {
        std::string name;
        WordLang lang;
        std::vector<std::string> values;
    };

    std::vector<Group> extension_groups_;
    std::vector<CatalogEntry> critical_files_;
    std::vector<CatalogEntry> specific_files_;
    std::vector<CatalogEntry> vcs_files_;
    std::vector<WordGroup> word_groups_;

    Catalog();

    const Group& group(const std::string& name) const;
    const WordGroup& word_group(const std::string& name) const;
    bool word_allowed(const std::string& word, Language lang) const;
};
