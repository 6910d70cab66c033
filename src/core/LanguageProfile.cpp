#include "core/LanguageProfile.hpp"
#include <map>

namespace docpatch {

namespace {

LanguageProfile c_family(Language lang) {
    LanguageProfile profile;
    profile.language = lang;
    profile.line_comment = "//";
    profile.block_open = "/*";
    profile.block_close = "*/";
    profile.doc_comment = "/**";
    return profile;
}

std::map<Language, LanguageProfile> build_profiles() {
    std::map<Language, LanguageProfile> profiles;

    LanguageProfile python;
    python.language = Language::PYTHON;
    python.line_comment = "#";
    python.doc_comment = "\"\"\"";
    python.docstring_markers = {"\"\"\"", "'''"};
    python.docstring_follows_definition = true;
    profiles.emplace(Language::PYTHON, python);

    profiles.emplace(Language::JAVASCRIPT, c_family(Language::JAVASCRIPT));
    profiles.emplace(Language::TYPESCRIPT, c_family(Language::TYPESCRIPT));
    profiles.emplace(Language::JAVA, c_family(Language::JAVA));
    profiles.emplace(Language::CPP, c_family(Language::CPP));
    profiles.emplace(Language::C, c_family(Language::C));

    LanguageProfile go;
    go.language = Language::GO;
    go.line_comment = "//";
    go.doc_comment = "//";
    profiles.emplace(Language::GO, go);

    LanguageProfile rust;
    rust.language = Language::RUST;
    rust.line_comment = "//";
    rust.doc_comment = "///";
    profiles.emplace(Language::RUST, rust);

    return profiles;
}

}  // namespace

const LanguageProfile& LanguageProfile::for_language(Language lang) {
    static const std::map<Language, LanguageProfile> profiles = build_profiles();
    static const LanguageProfile empty;

    auto it = profiles.find(lang);
    return it != profiles.end() ? it->second : empty;
}

} // namespace docpatch
