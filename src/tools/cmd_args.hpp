#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// trim whitespace (both ends)
inline std::string trim(std::string s) {
    auto isspace = [](unsigned char c){ return std::isspace(c); };
    auto b = std::find_if_not(s.begin(), s.end(), isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), isspace).base();
    if (b >= e) return {};
    return {b, e};
}

struct cmd_args {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;

    // `flags` names boolean options (long or single-char short): they never take the
    // next argument as their value, so "-d file" leaves "file" positional.
    static cmd_args parse(int argc, char* argv[], const std::set<std::string>& flags = {}) {
        cmd_args result;

        auto put = [&](std::string k, std::string v) {
            result.options[trim(std::move(k))] = trim(std::move(v));
        };
        auto is_flag = [&](const std::string& key) { return flags.count(key) != 0; };
        auto takes_next = [&](int i) {
            return i + 1 < argc && std::string(argv[i + 1]).rfind('-', 0) != 0
                   && std::string(argv[i + 1]) != "=";
        };

        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // everything after "--" is positional, including "-" and "-x"
            if (options_done) {
                result.positional.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }

            // ----- LONG OPTIONS -----
            if (arg.rfind("--", 0) == 0) {
                std::string rest = arg.substr(2);
                // handle --key[=value] and --key = value
                auto eq = rest.find('=');
                if (eq != std::string::npos) {
                    std::string key = trim(rest.substr(0, eq));
                    std::string val = trim(rest.substr(eq + 1));
                    // Consistent behavior with short options: --key= becomes "true"
                    put(key, val.empty() ? "true" : val);
                } else {
                    std::string key = trim(rest);
                    if (is_flag(key)) {
                        put(key, "true");
                    } else if (i + 2 < argc && std::string(argv[i + 1]) == "=") {
                        // support: --key value  OR  --key = value
                        put(key, argv[i + 2]);
                        i += 2;
                    } else if (takes_next(i)) {
                        put(key, argv[++i]);
                    } else {
                        put(key, "true");
                    }
                }
                continue;
            }

            // ----- SHORT OPTIONS (including grouped) -----
            // a lone "-" is the stdin sentinel and stays positional
            if (arg.size() >= 2 && arg[0] == '-') {
                std::string s = arg.substr(1);

                // -x=value  (explicit value for short)
                auto eq = s.find('=');
                if (eq != std::string::npos && eq >= 1) {
                    std::string key(1, s[0]);
                    std::string val = s.substr(eq + 1);
                    put(key, val.empty() ? "true" : val);
                    continue;
                }

                if (s.size() > 1) {
                    // Treat as grouped flags: -abc => a=true,b=true,c=true
                    for (char ch : s) put(std::string(1, ch), "true");
                } else if (is_flag(s)) {
                    put(s, "true");
                } else {
                    // single short: -o  [value]  or  -o = value
                    if (i + 2 < argc && std::string(argv[i + 1]) == "=") {
                        put(s, argv[i + 2]);
                        i += 2;
                    } else if (takes_next(i)) {
                        put(s, argv[++i]);
                    } else {
                        put(s, "true");
                    }
                }
                continue;
            }

            // positionals are file names: keep them byte for byte
            result.positional.push_back(arg);
        }

        return result;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        if (const auto it = options.find(std::string(key)); it != options.end()) return it->second;
        return std::nullopt;
    }

    [[nodiscard]] bool has(std::string_view key) const {
        return options.count(std::string(key)) != 0;
    }
};
