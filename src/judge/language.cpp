#include "judge/language.hpp"
#include "common/io_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

bool language::compiled() const {
    return !compile_command.empty();
}

void from_json(const json &j, language &lang) {
    j.at("name").get_to(lang.name);
    lang.source_file = assert_safe_path(j.at("source_file").get<string>());
    if (j.count("compile"))
        j.at("compile").get_to(lang.compile_command);
    else
        lang.compile_command.clear();
    j.at("run").get_to(lang.run_command);
    if (j.count("artifacts"))
        j.at("artifacts").get_to(lang.artifacts);
    else
        lang.artifacts.clear();
    for (auto &artifact : lang.artifacts)
        assert_safe_path(artifact);
}

language_table language_table::defaults() {
    language_table table;
    table.add({"c", "main.c", {"/usr/bin/gcc", "-O2", "-std=c11", "-o", "main", "main.c", "-lm"}, {"./main"}, {"main"}});
    table.add({"cpp", "main.cpp", {"/usr/bin/g++", "-O2", "-std=c++17", "-o", "main", "main.cpp"}, {"./main"}, {"main"}});
    table.add({"java", "Main.java", {"/usr/bin/javac", "-encoding", "UTF-8", "Main.java"}, {"/usr/bin/java", "-Xss64m", "Main"}, {"."}});
    table.add({"python", "main.py", {}, {"/usr/bin/python3", "main.py"}, {}});
    table.add({"javascript", "main.js", {}, {"/usr/bin/node", "main.js"}, {}});
    return table;
}

void language_table::add(const language &lang) {
    languages[lang.name] = lang;
}

const language *language_table::find(const string &name) const {
    auto it = languages.find(name);
    return it == languages.end() ? nullptr : &it->second;
}

}  // namespace arbiter
