#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "exec_kernel/python_parser.h"
#include "exec_kernel/logging.h"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace exec_kernel {

namespace {

struct PyDecRef {
    void operator()(PyObject* o) const { Py_XDECREF(o); }
};
using PyRef = std::unique_ptr<PyObject, PyDecRef>;

class GilGuard {
public:
    GilGuard() : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }

    GilGuard(const GilGuard&) = delete;
    GilGuard& operator=(const GilGuard&) = delete;

private:
    PyGILState_STATE state_;
};

std::once_flag interpreter_once;

void start_interpreter() {
    // Already running when this library was imported as an extension module.
    if (Py_IsInitialized()) return;

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.install_signal_handlers = 0;
    config.site_import = 0;
    config.write_bytecode = 0;
    PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        throw std::runtime_error(std::string("cannot start embedded Python: ") +
                                 (status.err_msg ? status.err_msg : "unknown error"));
    }
    // Initialization leaves this thread holding the GIL; parse() takes it per call.
    PyEval_SaveThread();
    logger()->debug("embedded Python {} started for syntax checks", PythonParser::version());
}

std::string str_of(PyObject* obj) {
    PyRef s(PyObject_Str(obj));
    if (!s) {
        PyErr_Clear();
        return {};
    }
    const char* utf8 = PyUnicode_AsUTF8(s.get());
    if (!utf8) {
        PyErr_Clear();
        return {};
    }
    return utf8;
}

std::string str_attr(PyObject* obj, const char* name) {
    PyRef v(PyObject_GetAttrString(obj, name));
    if (!v) {
        PyErr_Clear();
        return {};
    }
    return v.get() == Py_None ? std::string() : str_of(v.get());
}

int int_attr(PyObject* obj, const char* name) {
    PyRef v(PyObject_GetAttrString(obj, name));
    if (!v || v.get() == Py_None) {
        PyErr_Clear();
        return 0;
    }
    long n = PyLong_AsLong(v.get());
    if (n == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return 0;
    }
    return static_cast<int>(n);
}

} // anonymous namespace

SyntaxCheck PythonParser::parse(const std::string& code) {
    std::call_once(interpreter_once, start_interpreter);
    GilGuard gil;

    PyCompilerFlags flags;
    flags.cf_flags = PyCF_ONLY_AST;
    flags.cf_feature_version = PY_MINOR_VERSION;
    PyRef tree(Py_CompileStringExFlags(code.c_str(), "<string>", Py_file_input, &flags, -1));
    if (tree) return SyntaxCheck::ok();

    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);

    // IndentationError and TabError are SyntaxError subclasses.
    if (type && value && PyErr_GivenExceptionMatches(type, PyExc_SyntaxError)) {
        std::string msg = str_attr(value, "msg");
        return SyntaxCheck::error(msg.empty() ? "invalid syntax" : msg,
                                  int_attr(value, "lineno"), int_attr(value, "offset"));
    }

    // RecursionError, MemoryError, ValueError: the source did not parse.
    std::string kind = type ? str_attr(type, "__name__") : std::string("error");
    std::string what = value ? str_of(value) : std::string();
    return SyntaxCheck::error(what.empty() ? kind : kind + ": " + what, 0, 0);
}

std::string PythonParser::version() {
    std::string v = Py_GetVersion();
    return v.substr(0, v.find(' '));
}

} // namespace exec_kernel
