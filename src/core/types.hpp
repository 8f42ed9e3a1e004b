#pragma once

#include <string>
#include <optional>
#include <vector>
#include <utility>
#include <initializer_list>
#include <type_traits>
#include <fmt/format.h>

// What went wrong, for callers that want to react to a specific failure
enum class ErrorKind {
    None,
    DuplicateTemplateName,
    EmptyOwnerOrRepo,
    AlreadyInitialized,
    NotInitialized,
    UnknownTemplate,
    MissingParameter,
    InvalidTemplateFile,
    FileReadFailed,
    InvalidConfig,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::string subject;    // offending template / placeholder name, if any
    std::string context;    // enclosing template for a MissingParameter subject

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err,
                         const std::string& subject = "") {
        return {false, T{}, err, kind, subject};
    }

    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.subject, other.context};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::string subject;
    std::string context;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err,
                            const std::string& subject = "") {
        return {false, err, kind, subject};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind, other.subject, other.context};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

enum class HyperlinkMode {
    Auto,       // defer to the terminal capability signal
    Always,
    Never,
};

const char* hyperlink_mode_name(HyperlinkMode mode);
std::optional<HyperlinkMode> parse_hyperlink_mode(const std::string& s);

// Where a report was raised from
struct CallSite {
    std::string file;
    int line = 0;
};

#define BUGREP_SITE (::CallSite{__FILE__, __LINE__})

// Placeholder name -> value. Keeps the caller's insertion order so the
// diagnostic block lists parameters the way they were written.
class ParameterMap {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    // One `{key, value}` item of an initializer list. Non-string values go
    // through fmt::to_string, so `{"line", 42}` works.
    struct Param {
        std::string key;
        std::string value;

        Param(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}

        template <typename T,
                  typename = std::enable_if_t<!std::is_convertible_v<const T&, std::string>>>
        Param(std::string k, const T& v) : key(std::move(k)), value(fmt::to_string(v)) {}
    };

    ParameterMap() = default;
    ParameterMap(std::initializer_list<Param> entries);

    // Replaces the value in place when the key already exists.
    ParameterMap& set(const std::string& key, const std::string& value);

    template <typename T,
              typename = std::enable_if_t<!std::is_convertible_v<const T&, std::string>>>
    ParameterMap& set(const std::string& key, const T& value) {
        return set(key, fmt::to_string(value));
    }

    // nullptr if absent
    const std::string* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};
