#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line parser for `hazelnutd <command> [args] [options]`.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`; short
 * options (`-h`, `-c file`) are mapped to their long form. Only options listed
 * in @a value_flags consume a value, so boolean flags never swallow a
 * following command word. Options not in @a known_flags are collected
 * separately and everything else is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value

    void add(const std::string& key, const std::set<std::string>& known_flags) {
        if (known_flags.empty() || known_flags.count(key))
            flags_.insert(key);
        else
            unknown_flags_.push_back(key);
    }

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted long flags. If empty, all flags are known.
     * @param value_flags Long flags that take a value.
     * @param short_map   Mapping from single character options to long flags.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {}) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positional = true;
                continue;
            }
            std::string key;
            std::string val;
            bool has_val = false;
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                key = arg.substr(0, eq);
                if (eq != std::string::npos) {
                    val = arg.substr(eq + 1);
                    has_val = true;
                }
            } else {
                auto it = short_map.find(arg[1]);
                if (it == short_map.end()) {
                    unknown_flags_.push_back(arg);
                    continue;
                }
                key = it->second;
                if (arg.size() > 2) {
                    val = arg.substr(arg[2] == '=' ? 3 : 2);
                    has_val = true;
                }
            }
            if (value_flags.count(key)) {
                if (!has_val) {
                    if (i + 1 < argc) {
                        val = argv[++i];
                    } else {
                        missing_values_.push_back(key);
                        continue;
                    }
                }
                add(key, known_flags);
                if (flags_.count(key))
                    options_[key] = val;
            } else {
                add(key, known_flags);
            }
        }
    }

    /** @return `true` if the flag was present. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
