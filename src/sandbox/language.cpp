#include "sandbox/language.hpp"
#include "config.hpp"

namespace scorer {
using namespace std;

// Python 解释器在语法检查失败时输出的异常类型
static const char *PYTHON_COMPILATION_MARKERS[] = {
    "SyntaxError:",
    "IndentationError:",
    "TabError:"};

language::~language() {}

string python_language::name() const {
    return "python";
}

string python_language::source_filename() const {
    return "client_script.py";
}

vector<string> python_language::run_command(const string &source) const {
    return {INTERPRETER, source};
}

bool python_language::is_compilation_error(const string &error) const {
    for (const char *marker : PYTHON_COMPILATION_MARKERS)
        if (error.find(marker) != string::npos)
            return true;
    return false;
}

const language &default_language() {
    static python_language python;
    return python;
}

}  // namespace scorer
