#ifndef CHAINER_FACT_LEXER_H
#define CHAINER_FACT_LEXER_H

#include <string>

#ifndef YY_TYPEDEF_YY_SCANNER_T
#define YY_TYPEDEF_YY_SCANNER_T
typedef void *yyscan_t;
#endif

namespace Chainer
{
    // flex 可重入扫描器的外壳：持有 yyscan_t，记录列号和第一个错误。
    // 实现在 src/parser/fact.l 的用户代码段中。
    class FactLexer
    {
    public:
        explicit FactLexer(const std::string &text);
        ~FactLexer();
        FactLexer(const FactLexer &) = delete;
        FactLexer &operator=(const FactLexer &) = delete;

        yyscan_t getScanner() const { return scanner; }

        // 每个匹配到的 token 调用一次，length 为 token 长度
        void advance(int length);

        void fail(const std::string &message);
        bool failed() const { return hasError; }
        const std::string &getError() const { return error; }
        int getErrorColumn() const { return errorColumn; }

    private:
        std::string text;       // flex 扫描期间需要稳定的缓冲区
        yyscan_t scanner = nullptr;
        int column = 1;         // 下一个字符的列号，从 1 开始
        int tokenColumn = 1;    // 当前 token 起始列
        bool hasError = false;
        std::string error;
        int errorColumn = 0;
    };
}

#endif // CHAINER_FACT_LEXER_H
