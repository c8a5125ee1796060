#include "sandbox/templates.hpp"

#include <algorithm>

namespace codebox::sandbox {
namespace {

const char* kPythonDriver = R"PY(
import ast, base64, json, signal, sys, traceback

_proto = sys.stdout.buffer
_current = [0]
_streams = []

def _write(message):
    # Lone surrogates (undecodable file names and the like) become "?".
    line = json.dumps(message, ensure_ascii=False).encode("utf-8", "replace")
    _proto.write(line + b"\n")
    _proto.flush()

def _send(message):
    for stream in _streams:
        stream.flush()
    _write(message)

class _Stream(object):
    def __init__(self, name):
        self._name = name
        self._pending = ""
        _streams.append(self)
    def write(self, text):
        if not isinstance(text, str):
            text = str(text)
        self._pending += text
        while "\n" in self._pending:
            line, self._pending = self._pending.split("\n", 1)
            self._emit(line + "\n")
        return len(text)
    def flush(self):
        if self._pending:
            text, self._pending = self._pending, ""
            self._emit(text)
    def _emit(self, text):
        _write({"type": "stream", "id": _current[0], "name": self._name, "text": text})
    def isatty(self):
        return False

def _bundle(value):
    data = {"text/plain": repr(value)}
    for mime, method in (("text/html", "_repr_html_"), ("text/markdown", "_repr_markdown_"),
                         ("image/png", "_repr_png_"), ("image/jpeg", "_repr_jpeg_"),
                         ("image/svg+xml", "_repr_svg_"), ("application/json", "_repr_json_")):
        render = getattr(value, method, None)
        if render is None:
            continue
        try:
            payload = render()
        except Exception:
            continue
        if payload is None:
            continue
        if isinstance(payload, bytes):
            payload = base64.b64encode(payload).decode("ascii")
        elif not isinstance(payload, str):
            payload = json.dumps(payload)
        data[mime] = payload
    return data

def display(value):
    _send({"type": "result", "id": _current[0], "main": False, "data": _bundle(value)})

_namespace = {"__name__": "__main__", "display": display}

def _run(code):
    tree = ast.parse(code, "<cell>", "exec")
    tail = None
    if tree.body and isinstance(tree.body[-1], ast.Expr):
        tail = ast.Expression(tree.body.pop().value)
    exec(compile(tree, "<cell>", "exec"), _namespace)
    if tail is not None:
        value = eval(compile(tail, "<cell>", "eval"), _namespace)
        if value is not None:
            _send({"type": "result", "id": _current[0], "main": True, "data": _bundle(value)})

sys.stdout = _Stream("stdout")
sys.stderr = _Stream("stderr")
signal.signal(signal.SIGINT, signal.default_int_handler)
_send({"type": "ready"})

while True:
    try:
        line = sys.stdin.readline()
    except KeyboardInterrupt:
        continue
    if not line:
        break
    try:
        request = json.loads(line)
    except ValueError:
        continue
    if request.get("type") != "execute":
        continue
    _current[0] = request.get("id", 0)
    try:
        _run(request.get("code", ""))
    except SystemExit:
        _send({"type": "done", "id": _current[0]})
        break
    except BaseException as exc:
        _send({"type": "error", "id": _current[0], "name": type(exc).__name__, "value": str(exc),
               "traceback": traceback.format_exception(type(exc), exc, exc.__traceback__)})
    _send({"type": "done", "id": _current[0]})
)PY";

}  // namespace

const std::string& PythonKernelDriver() {
    static const std::string driver(kPythonDriver);
    return driver;
}

TemplateCatalog::TemplateCatalog() {
    codebox::config::TemplateConfig python{};
    python.command = {"python3", "-u", "-c", PythonKernelDriver()};
    python.env["PYTHONUNBUFFERED"] = "1";
    python.env["PYTHONDONTWRITEBYTECODE"] = "1";
    python.limits.memory_mb = 2048;
    Register("python", std::move(python));
}

TemplateCatalog::TemplateCatalog(
    const std::unordered_map<std::string, codebox::config::TemplateConfig>& overrides)
    : TemplateCatalog() {
    for (const auto& [name, config] : overrides) {
        Register(name, config);
    }
}

void TemplateCatalog::Register(const std::string& name, codebox::config::TemplateConfig config) {
    templates_.insert_or_assign(name, std::move(config));
}

std::optional<codebox::config::TemplateConfig> TemplateCatalog::Find(const std::string& name) const {
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> TemplateCatalog::Names() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : templates_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace codebox::sandbox
