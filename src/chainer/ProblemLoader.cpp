#include "ProblemLoader.h"
#include "FactParser.h"
#include "Errors.h"
#include <fstream>
#include <limits>

namespace Chainer
{
    Fact ProblemLoader::loadFromFile(const std::string &path, KnowledgeBase &kb, ChainerOptions &options)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw ProblemFormatError("cannot open problem file: " + path);
        }

        json data;
        try
        {
            file >> data;
        }
        catch (const json::parse_error &e)
        {
            throw ProblemFormatError(path + " is not valid JSON: " + e.what());
        }
        return loadFromJson(data, kb, options);
    }

    Fact ProblemLoader::loadFromString(const std::string &text, KnowledgeBase &kb, ChainerOptions &options)
    {
        json data;
        try
        {
            data = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw ProblemFormatError(std::string("problem is not valid JSON: ") + e.what());
        }
        return loadFromJson(data, kb, options);
    }

    Fact ProblemLoader::loadFromJson(const json &data, KnowledgeBase &kb, ChainerOptions &options)
    {
        if (!data.is_object())
        {
            throw ProblemFormatError("problem must be a JSON object");
        }
        for (const char *key : {"facts", "rules", "query"})
        {
            if (!data.contains(key))
            {
                throw ProblemFormatError(std::string("problem is missing \"") + key + "\"");
            }
        }

        // 选项要先应用，strict_arity 会影响后面的解析
        if (data.contains("options"))
        {
            applyOptions(data["options"], kb, options);
        }

        for (const auto &text : stringArray(data["facts"], "facts"))
        {
            FactParser::addFact(text, kb);
        }

        const json &rules = data["rules"];
        if (!rules.is_array())
        {
            throw ProblemFormatError("\"rules\" must be an array");
        }
        for (size_t i = 0; i < rules.size(); ++i)
        {
            loadRule(rules[i], i, kb);
        }

        return FactParser::parseQuery(stringValue(data["query"], "query"), kb);
    }

    void ProblemLoader::applyOptions(const json &data, KnowledgeBase &kb, ChainerOptions &options)
    {
        if (!data.is_object())
        {
            throw ProblemFormatError("\"options\" must be an object");
        }
        if (data.contains("round_cap"))
        {
            const json &cap = data["round_cap"];
            if (!cap.is_number_integer() || cap.get<long long>() <= 0 ||
                cap.get<long long>() > std::numeric_limits<int>::max())
            {
                throw ProblemFormatError("options.round_cap must be a positive integer");
            }
            options.roundCap = cap.get<int>();
        }
        if (data.contains("threads"))
        {
            const json &threads = data["threads"];
            if (!threads.is_number_integer() || threads.get<long long>() < 0)
            {
                throw ProblemFormatError("options.threads must be a non-negative integer");
            }
            options.workerThreads = threads.get<unsigned>();
        }
        if (data.contains("strict_arity"))
        {
            if (!data["strict_arity"].is_boolean())
            {
                throw ProblemFormatError("options.strict_arity must be a boolean");
            }
            kb.setStrictArity(data["strict_arity"].get<bool>());
        }
        if (data.contains("verbose"))
        {
            if (!data["verbose"].is_boolean())
            {
                throw ProblemFormatError("options.verbose must be a boolean");
            }
            options.verbose = data["verbose"].get<bool>();
        }
    }

    void ProblemLoader::loadRule(const json &rule, size_t index, KnowledgeBase &kb)
    {
        std::string where = "rules[" + std::to_string(index) + "]";

        // 两种写法：{"premises": [...], "conclusion": "..."} 或 [[...], "..."]
        if (rule.is_object())
        {
            if (!rule.contains("premises") || !rule.contains("conclusion"))
            {
                throw ProblemFormatError(where + " needs \"premises\" and \"conclusion\"");
            }
            FactParser::addRule(stringArray(rule["premises"], where + ".premises"),
                                stringValue(rule["conclusion"], where + ".conclusion"), kb);
        }
        else if (rule.is_array() && rule.size() == 2)
        {
            FactParser::addRule(stringArray(rule[0], where + "[0]"),
                                stringValue(rule[1], where + "[1]"), kb);
        }
        else
        {
            throw ProblemFormatError(where + " must be an object or a [premises, conclusion] pair");
        }
    }

    std::vector<std::string> ProblemLoader::stringArray(const json &data, const std::string &where)
    {
        if (!data.is_array())
        {
            throw ProblemFormatError("\"" + where + "\" must be an array of strings");
        }
        std::vector<std::string> result;
        for (size_t i = 0; i < data.size(); ++i)
        {
            result.push_back(stringValue(data[i], where + "[" + std::to_string(i) + "]"));
        }
        return result;
    }

    std::string ProblemLoader::stringValue(const json &data, const std::string &where)
    {
        if (!data.is_string())
        {
            throw ProblemFormatError("\"" + where + "\" must be a string");
        }
        return data.get<std::string>();
    }
}
