#include <yaml-cpp/yaml.h>
#include "../include/Definition.hpp"
#include <fstream>
#include <sstream>

using namespace devops;
namespace fs = std::filesystem;

namespace {
    // Walks a decoded YAML tree; every error names the key path it failed on.
    struct Reader {
        std::string origin;

        [[noreturn]] void bad(const std::string &path, const std::string &msg) const {
            throw DefinitionError("[devops] " + origin + ": " + path + ": " + msg);
        }

        static std::string join(const std::string &path, const std::string &key) {
            return path.empty() ? key : path + "." + key;
        }

        [[nodiscard]] std::string scalar(const YAML::Node &parent, const std::string &key,
                                         const std::string &path) const {
            const YAML::Node n = parent[key];
            if (!n.IsDefined() || n.IsNull()) return "";
            if (!n.IsScalar()) bad(join(path, key), "expected a string");
            return n.Scalar();
        }

        [[nodiscard]] bool flag(const YAML::Node &parent, const std::string &key, const std::string &path) const {
            const YAML::Node n = parent[key];
            if (!n.IsDefined() || n.IsNull()) return false;
            try {
                return n.as<bool>();
            } catch (const YAML::BadConversion &) {
                bad(join(path, key), "expected true or false");
            }
        }

        [[nodiscard]] std::vector<std::string> list(const YAML::Node &parent, const std::string &key,
                                                    const std::string &path) const {
            std::vector<std::string> out;
            const YAML::Node n = parent[key];
            if (!n.IsDefined() || n.IsNull()) return out;
            if (!n.IsSequence()) bad(join(path, key), "expected a list");
            out.reserve(n.size());
            for (std::size_t i = 0; i < n.size(); ++i) {
                if (!n[i].IsScalar()) bad(join(path, key) + "[" + std::to_string(i) + "]", "expected a string");
                out.push_back(n[i].Scalar());
            }
            return out;
        }

        [[nodiscard]] EnvMap mapping(const YAML::Node &parent, const std::string &key, const std::string &path) const {
            EnvMap out;
            const YAML::Node n = parent[key];
            if (!n.IsDefined() || n.IsNull()) return out;
            if (!n.IsMap()) bad(join(path, key), "expected a mapping");
            for (const auto &kv: n) {
                const auto name = kv.first.Scalar();
                if (!kv.second.IsScalar() && !kv.second.IsNull()) bad(join(join(path, key), name), "expected a string");
                out[name] = kv.second.IsNull() ? "" : kv.second.Scalar();
            }
            return out;
        }

        [[nodiscard]] Operation operation(const YAML::Node &parent, const std::string &key,
                                          const std::string &path) const {
            Operation op;
            const YAML::Node n = parent[key];
            if (!n.IsDefined() || n.IsNull()) return op;
            if (!n.IsMap()) bad(join(path, key), "expected a mapping");
            const auto here = join(path, key);
            op.fail_fast = flag(n, "fail_fast", here);
            op.env = mapping(n, "env", here);
            op.steps = list(n, "steps", here);
            return op;
        }
    };
}

TaskDefinition devops::parse_definition(const std::string &yaml, const std::string &origin) {
    const Reader r{origin};
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception &e) {
        throw DefinitionError("[devops] " + origin + ": failed to decode YAML: " + e.what());
    }
    if (!root.IsDefined() || root.IsNull()) r.bad("<root>", "definition is empty");
    if (!root.IsMap()) r.bad("<root>", "expected a mapping");

    TaskDefinition d;
    d.id = r.scalar(root, "id", "");
    d.name = r.scalar(root, "name", "");
    d.version = r.scalar(root, "version", "");
    d.description = r.scalar(root, "description", "");
    d.repo_url = r.scalar(root, "repo_url", "");

    if (const YAML::Node cb = root["codebase"]; cb.IsDefined() && !cb.IsNull()) {
        if (!cb.IsMap()) r.bad("codebase", "expected a mapping");
        d.codebase.language = r.scalar(cb, "language", "codebase");
        d.codebase.dependencies = r.list(cb, "dependencies", "codebase");
        d.codebase.install = r.operation(cb, "install", "codebase");
        d.codebase.test = r.operation(cb, "test", "codebase");
        d.codebase.build = r.operation(cb, "build", "codebase");
    }
    return d;
}

TaskDefinition devops::load_definition(const fs::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) throw DefinitionError("[devops] failed to open definition file: " + path.string());
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_definition(buf.str(), path.string());
}

fs::path devops::resolve_definition_path(const std::optional<std::string> &flag, const EnvList &env) {
    if (flag && !flag->empty()) return fs::absolute(*flag);
    if (const auto v = env_lookup(env, "DEVOPS_DEFINITION"); v && !v->empty()) return fs::absolute(*v);
    return fs::current_path() / DEFINITION_FILE;
}
