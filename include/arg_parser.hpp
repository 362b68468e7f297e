#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for long and short options.
 *
 * Recognizes `--flag`, `--opt value`, `--opt=value` and single-letter aliases
 * such as `-q`, `-qv` or `-l file`. Options listed in @a value_flags consume a value;
 * every other flag is boolean, so `--quiet /srv/backup` leaves the path as a
 * positional argument. Flags missing from @a known_flags are collected in
 * @ref unknown_flags instead of being stored.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value flags given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

    void store(const std::string& key, const std::string* value) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted flags; empty accepts everything.
     * @param value_flags Flags that take a value.
     * @param short_map   Single-letter aliases mapped to their long form.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positional = true;
                continue;
            }
            std::string key;
            if (arg.rfind("--", 0) == 0) {
                key = arg;
            } else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                key = short_map_.at(arg[1]);
                if (arg.size() > 2 && value_flags_.count(key)) {
                    // -lfile or -l=file
                    std::string val = arg.substr(arg[2] == '=' ? 3 : 2);
                    store(key, &val);
                    continue;
                }
                if (arg.size() > 2) {
                    // stacked boolean aliases such as -qv
                    for (size_t j = 1; j < arg.size(); ++j) {
                        auto it = short_map_.find(arg[j]);
                        if (it == short_map_.end())
                            unknown_flags_.push_back(std::string("-") + arg[j]);
                        else
                            store(it->second, nullptr);
                    }
                    continue;
                }
            } else {
                positional_.push_back(arg);
                continue;
            }

            size_t eq = key.find('=');
            if (eq != std::string::npos) {
                std::string val = key.substr(eq + 1);
                store(key.substr(0, eq), &val);
            } else if (value_flags_.count(key)) {
                if (i + 1 < argc) {
                    std::string val = argv[++i];
                    store(key, &val);
                } else {
                    missing_values_.push_back(key);
                }
            } else {
                store(key, nullptr);
            }
        }
    }

    /** @return `true` if @p flag (including the leading `--`) was given. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Value of @p opt or an empty string when it was not given. */
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
