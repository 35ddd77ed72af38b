#ifndef CHAINER_PROBLEM_LOADER_H
#define CHAINER_PROBLEM_LOADER_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "KnowledgeBase.h"
#include "ForwardChainer.h"

using json = nlohmann::json;

namespace Chainer
{
    // 从 JSON 读入问题：
    // {
    //   "facts":   ["American(Robert)", ...],
    //   "rules":   [{"premises": ["Missile(x)"], "conclusion": "Weapon(x)"}, [["Enemy(x, America)"], "Hostile(x)"]],
    //   "query":   "Criminal(Robert)",
    //   "options": {"round_cap": 1000, "threads": 1, "strict_arity": true, "verbose": false}
    // }
    // 结构错误抛出 ProblemFormatError，事实/规则本身的错误照常抛出 ParseError 等
    class ProblemLoader
    {
    public:
        static Fact loadFromFile(const std::string &path, KnowledgeBase &kb, ChainerOptions &options);
        static Fact loadFromString(const std::string &text, KnowledgeBase &kb, ChainerOptions &options);
        static Fact loadFromJson(const json &data, KnowledgeBase &kb, ChainerOptions &options);

    private:
        static void applyOptions(const json &data, KnowledgeBase &kb, ChainerOptions &options);
        static void loadRule(const json &rule, size_t index, KnowledgeBase &kb);
        static std::vector<std::string> stringArray(const json &data, const std::string &where);
        static std::string stringValue(const json &data, const std::string &where);
    };
}

#endif // CHAINER_PROBLEM_LOADER_H
