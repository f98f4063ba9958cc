#include "sandbox/language.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;

// clang-format off
static const unordered_map<language, const char *> language_name = boost::assign::map_list_of
    (language::PYTHON, "python")
    (language::JAVASCRIPT, "javascript")
    (language::CPP, "cpp");
// clang-format on

const char *get_language_name(language lang) {
    return language_name.at(lang);
}

language parse_language(const string &name) {
    for (auto &[lang, text] : language_name)
        if (name == text) return lang;
    throw invalid_argument("Unsupported language " + name);
}

const string &language_runner::image() const {
    return visit([](auto &r) -> const string & { return r.image; }, runner);
}

const string &language_runner::source_name() const {
    return visit([](auto &r) -> const string & { return r.source; }, runner);
}

vector<string> language_runner::prepare_command() const {
    return visit(overloaded{
                     [](const compiled_runner &r) {
                         vector<string> command = {r.compiler};
                         command.insert(command.end(), r.flags.begin(), r.flags.end());
                         command.insert(command.end(), {"-o", r.binary, r.source});
                         return command;
                     },
                     [](const auto &) { return vector<string>(); }},
                 runner);
}

vector<string> language_runner::run_command() const {
    return visit(overloaded{
                     [](const interpreted_runner &r) { return vector<string>{r.interpreter, r.source}; },
                     [](const vm_runner &r) { return vector<string>{r.runtime, r.source}; },
                     [](const compiled_runner &r) { return vector<string>{"./" + r.binary}; }},
                 runner);
}

vector<string> language_runner::artifact_files() const {
    return visit(overloaded{
                     [](const compiled_runner &r) { return vector<string>{r.binary}; },
                     [](const auto &r) { return vector<string>{r.source}; }},
                 runner);
}

status language_runner::empty_source_status() const {
    return holds_alternative<compiled_runner>(runner) ? status::COMPILE_ERROR : status::RUNTIME_ERROR;
}

language_runner make_runner(language lang) {
    switch (lang) {
        case language::PYTHON:
            return {lang, interpreted_runner{PYTHON_IMAGE, "python3", "solution.py"}};
        case language::JAVASCRIPT:
            return {lang, vm_runner{JAVASCRIPT_IMAGE, "node", "solution.js"}};
        case language::CPP: {
            vector<string> flags;
            string trimmed = boost::trim_copy(CPP_COMPILE_FLAGS);
            if (!trimmed.empty())
                boost::split(flags, trimmed, boost::is_any_of(" "), boost::token_compress_on);
            return {lang, compiled_runner{CPP_IMAGE, "g++", flags, "solution.cpp", "solution"}};
        }
    }
    throw invalid_argument("Unsupported language");
}

}  // namespace codebox
