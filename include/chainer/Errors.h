// Errors.h
#ifndef CHAINER_ERRORS_H
#define CHAINER_ERRORS_H

#include <stdexcept>
#include <string>

namespace Chainer
{
    // 所有输入结构错误的基类，在任何推理轮次开始前抛出
    class ChainerError : public std::runtime_error
    {
    public:
        explicit ChainerError(const std::string &message) : std::runtime_error(message) {}
    };

    class ParseError : public ChainerError
    {
    public:
        ParseError(const std::string &text, int column, const std::string &reason)
            : ChainerError("cannot parse '" + text + "' at column " + std::to_string(column) + ": " + reason),
              text(text), column(column) {}

        const std::string &getText() const { return text; }
        int getColumn() const { return column; }

    private:
        std::string text;
        int column;
    };

    class UnsafeRuleError : public ChainerError
    {
    public:
        explicit UnsafeRuleError(const std::string &message) : ChainerError(message) {}
    };

    class ArityMismatchError : public ChainerError
    {
    public:
        ArityMismatchError(const std::string &predicate, size_t expected, size_t actual)
            : ChainerError("predicate " + predicate + " used with " + std::to_string(actual) +
                           " arguments, previously declared with " + std::to_string(expected)) {}
    };

    class InvalidQueryError : public ChainerError
    {
    public:
        explicit InvalidQueryError(const std::string &message) : ChainerError(message) {}
    };

    class ProblemFormatError : public ChainerError
    {
    public:
        explicit ProblemFormatError(const std::string &message) : ChainerError(message) {}
    };
}

#endif // CHAINER_ERRORS_H
