#pragma once

#include "backend_registry.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace quboroute
{
    // Line-oriented backend configuration:
    //
    //   # comment
    //   backend id=anneal kind=specialized max_variables=4096 latency_ms=250 cost=1
    //   backend id=classical kind=classical max_variables=100000 latency_ms=50 cost=5 healthy=1
    //   backend id=legacy kind=specialized max_variables=64 removed=1
    //
    // `id`, `kind` and `max_variables` are required.
    namespace detail
    {
        [[noreturn]] inline void config_error(std::size_t line, const std::string &what)
        {
            throw std::runtime_error("backend config line " + std::to_string(line) + ": " + what);
        }

        inline std::uint64_t parse_config_u64(std::size_t line, const std::string &key, const std::string &v)
        {
            std::uint64_t out = 0;
            const auto r = std::from_chars(v.data(), v.data() + v.size(), out);
            if (v.empty() || r.ec != std::errc() || r.ptr != v.data() + v.size())
            {
                config_error(line, key + " must be a non-negative integer, got '" + v + "'");
            }
            return out;
        }

        inline double parse_config_double(std::size_t line, const std::string &key, const std::string &v)
        {
            double out = 0.0;
            const auto r = std::from_chars(v.data(), v.data() + v.size(), out);
            if (v.empty() || r.ec != std::errc() || r.ptr != v.data() + v.size() || !std::isfinite(out) || out < 0.0)
            {
                config_error(line, key + " must be a finite non-negative number, got '" + v + "'");
            }
            return out;
        }

        inline bool parse_config_bool(std::size_t line, const std::string &key, const std::string &v)
        {
            if (v == "1" || v == "true" || v == "yes")
            {
                return true;
            }
            if (v == "0" || v == "false" || v == "no")
            {
                return false;
            }
            config_error(line, key + " must be a boolean, got '" + v + "'");
        }
    }

    inline std::vector<BackendConfigEntry> parse_backend_config(std::istream &in)
    {
        std::vector<BackendConfigEntry> out;
        std::string text;
        std::size_t lineNo = 0;
        while (std::getline(in, text))
        {
            ++lineNo;
            if (const auto hash = text.find('#'); hash != std::string::npos)
            {
                text.erase(hash);
            }
            std::istringstream tokens(text);
            std::string word;
            if (!(tokens >> word))
            {
                continue;
            }
            if (word != "backend")
            {
                detail::config_error(lineNo, "expected 'backend', got '" + word + "'");
            }

            BackendConfigEntry e;
            bool haveKind = false;
            bool haveMax = false;
            while (tokens >> word)
            {
                const auto eq = word.find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    detail::config_error(lineNo, "expected key=value, got '" + word + "'");
                }
                const std::string key = word.substr(0, eq);
                const std::string value = word.substr(eq + 1);
                if (key == "id")
                {
                    e.descriptor.id = value;
                }
                else if (key == "kind")
                {
                    if (value == "specialized")
                    {
                        e.descriptor.kind = BackendKind::SpecializedSolver;
                    }
                    else if (value == "classical")
                    {
                        e.descriptor.kind = BackendKind::ClassicalFallback;
                    }
                    else
                    {
                        detail::config_error(lineNo, "unknown kind '" + value + "'");
                    }
                    haveKind = true;
                }
                else if (key == "max_variables")
                {
                    e.descriptor.maxVariables = static_cast<std::size_t>(detail::parse_config_u64(lineNo, key, value));
                    haveMax = true;
                }
                else if (key == "latency_ms")
                {
                    e.descriptor.expectedLatencyMs = detail::parse_config_double(lineNo, key, value);
                }
                else if (key == "cost")
                {
                    e.descriptor.costWeight = detail::parse_config_double(lineNo, key, value);
                }
                else if (key == "healthy")
                {
                    e.descriptor.healthy = detail::parse_config_bool(lineNo, key, value);
                }
                else if (key == "removed")
                {
                    e.removed = detail::parse_config_bool(lineNo, key, value);
                }
                else
                {
                    detail::config_error(lineNo, "unknown key '" + key + "'");
                }
            }

            if (e.descriptor.id.empty())
            {
                detail::config_error(lineNo, "missing id");
            }
            if (!e.removed && (!haveKind || !haveMax))
            {
                detail::config_error(lineNo, "backend '" + e.descriptor.id + "' needs kind and max_variables");
            }
            for (const auto &prev : out)
            {
                if (prev.descriptor.id == e.descriptor.id)
                {
                    detail::config_error(lineNo, "duplicate backend id '" + e.descriptor.id + "'");
                }
            }
            out.push_back(std::move(e));
        }
        return out;
    }

    inline std::vector<BackendConfigEntry> load_backend_config(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
        {
            throw std::runtime_error("cannot open backend config '" + path + "'");
        }
        return parse_backend_config(in);
    }
}
