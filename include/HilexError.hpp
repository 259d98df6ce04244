#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace hilex {

// Where in a grammar a configuration error was found.
struct GrammarLocation {
    std::string grammar;  // grammar name (or "<anonymous>")
    std::string state;    // state name, empty when not state specific
    int rule = -1;        // 0-based rule index within the state, -1 if none

    GrammarLocation() = default;
    GrammarLocation(const std::string& g, const std::string& s = "", int r = -1)
        : grammar(g), state(s), rule(r) {}

    std::string to_string() const {
        std::string out = grammar.empty() ? "<anonymous>" : grammar;
        if (!state.empty()) out += ":" + state;
        if (rule >= 0) out += "#" + std::to_string(rule);
        return out;
    }
};

class HilexError : public std::runtime_error {
   public:
    HilexError(const std::string& type,
        const std::string& message,
        const GrammarLocation& loc)
        : std::runtime_error(format_message(type, message, loc)), type_(type), loc_(loc) {}

    HilexError(const std::string& type, const std::string& message)
        : std::runtime_error(type + "\n" + message), type_(type) {}

    const std::string& type() const { return type_; }
    const GrammarLocation& location() const { return loc_; }

   private:
    std::string type_;
    GrammarLocation loc_;

    static std::string format_message(const std::string& type,
        const std::string& message,
        const GrammarLocation& loc) {
        return type + " at " + loc.to_string() + "\n" + message;
    }
};

// A rule's regular expression failed to compile.
class InvalidPatternError : public HilexError {
   public:
    InvalidPatternError(const std::string& pattern, const std::string& reason, const GrammarLocation& loc)
        : HilexError("InvalidPatternError", "cannot compile pattern '" + pattern + "': " + reason, loc),
          pattern_(pattern) {}

    const std::string& pattern() const { return pattern_; }

   private:
    std::string pattern_;
};

// A Push/Goto/Include/combined target, or the root state, is missing.
class UnknownStateError : public HilexError {
   public:
    UnknownStateError(const std::string& missing, const GrammarLocation& loc)
        : HilexError("UnknownStateError", "reference to undefined state '" + missing + "'", loc),
          missing_(missing) {}

    const std::string& missing_state() const { return missing_; }

   private:
    std::string missing_;
};

class GrammarCycleError : public HilexError {
   public:
    GrammarCycleError(const std::vector<std::string>& cycle, const GrammarLocation& loc)
        : HilexError("GrammarCycleError", "include cycle: " + join(cycle), loc), cycle_(cycle) {}

    // States along the cycle; first and last entries are the same state.
    const std::vector<std::string>& cycle() const { return cycle_; }

   private:
    std::vector<std::string> cycle_;

    static std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += " -> ";
            out += parts[i];
        }
        return out;
    }
};

// A user-defined state carries the name reserved for a combined state.
class StateNameClashError : public HilexError {
   public:
    StateNameClashError(const std::string& state, const GrammarLocation& loc)
        : HilexError("StateNameClashError", "state '" + state + "' collides with a combined state of the same name", loc),
          state_(state) {}

    const std::string& state() const { return state_; }

   private:
    std::string state_;
};

class MalformedCompiledGrammarError : public HilexError {
   public:
    MalformedCompiledGrammarError(const std::string& message, const GrammarLocation& loc)
        : HilexError("MalformedCompiledGrammarError", message, loc) {}
};

// Unparseable state directive such as "#popx" or "#pop:abc".
class InvalidDirectiveError : public HilexError {
   public:
    explicit InvalidDirectiveError(const std::string& directive)
        : HilexError("InvalidDirectiveError", "invalid state directive '" + directive + "'") {}
};

// A JSON grammar or options document has the wrong shape.
class GrammarFormatError : public HilexError {
   public:
    GrammarFormatError(const std::string& where, const std::string& message)
        : HilexError("GrammarFormatError", where + ": " + message) {}
};

class UnknownEncodingError : public HilexError {
   public:
    explicit UnknownEncodingError(const std::string& encoding)
        : HilexError("UnknownEncodingError", "unsupported input encoding '" + encoding + "'") {}
};

class LexerNotFoundError : public HilexError {
   public:
    explicit LexerNotFoundError(const std::string& name)
        : HilexError("LexerNotFoundError", "no lexer for alias '" + name + "'") {}
};

}  // namespace hilex
