//    *************************** ParkVisionKit ****************************
//    Copyright (C) 2026  The ParkVisionKit Authors
//
//    This program is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with this program.  If not, see <https://www.gnu.org/licenses/>.
// 	  **********************************************************************

#include <sstream>
#include <algorithm>

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    inline bool OptionsParser::try_parse(ArgQueue& args) const
    {
        if(args.empty())
            return false;

        const auto option = args.front();

        // Custom parsers take priority, then variables and finally switches.
        if(has_parser(option))
            return m_ParserOptions.at(option)(args);

        if(has_variable(option))
        {
            if(args.size() < 2)
            {
                m_ErrorHandler(option, "");
                return false;
            }

            // Only consume the arguments on success
            if(m_VariableOptions.at(option)(args[1]))
            {
                args.pop_front();
                args.pop_front();
                return true;
            }
            return false;
        }

        if(has_switch(option))
        {
            if(const auto& callback = m_SwitchOptions.at(option); callback)
                callback();

            args.pop_front();
            return true;
        }

        return false;
    }

//---------------------------------------------------------------------------------------------------------------------

    template<typename T>
    inline std::optional<T> OptionsParser::parse_as(const std::string& argument)
    {
        if constexpr(std::is_same_v<T, std::string>)
        {
            // Paths may hold spaces, so take the argument whole.
            if(argument.empty())
                return std::nullopt;
            return argument;
        }
        else
        {
            std::istringstream parser(argument);

            T value;
            parser >> value;

            // Reject trailing garbage such as '12abc'
            if(parser.fail() || !(parser >> std::ws).eof())
                return std::nullopt;

            return value;
        }
    }

//---------------------------------------------------------------------------------------------------------------------

    template<typename T>
    inline void OptionsParser::add_variable(
        const std::initializer_list<std::string>& aliases,
        const std::string& description,
        T* location
    )
    {
        PVK_ASSERT(location != nullptr);

        add_variable<T>(aliases, description, std::function<void(T)>([location](T value){
            *location = std::move(value);
        }));
    }

//---------------------------------------------------------------------------------------------------------------------

    template<typename T>
    inline void OptionsParser::add_variable(
        const std::string& name,
        const std::string& description,
        T* location
    )
    {
        add_variable<T>({name}, description, location);
    }

//---------------------------------------------------------------------------------------------------------------------

    template<typename T>
    inline void OptionsParser::add_variable(
        const std::initializer_list<std::string>& aliases,
        const std::string& description,
        const std::function<void(T)>& callback
    )
    {
        PVK_ASSERT(aliases.size() > 0);
        PVK_ASSERT(callback);

        generate_manual_entry(aliases, description, true);

        for(const auto& name : aliases)
        {
            m_VariableOptions[name] = [=,this](const std::string& argument)
            {
                if(auto value = parse_as<T>(argument); value.has_value())
                {
                    callback(std::move(*value));
                    return true;
                }

                m_ErrorHandler(name, argument);
                return false;
            };
        }
    }

//---------------------------------------------------------------------------------------------------------------------

    template<typename T>
    inline void OptionsParser::add_variable(
        const std::string& name,
        const std::string& description,
        const std::function<void(T)>& callback
    )
    {
        add_variable<T>({name}, description, callback);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::add_switch(
        const std::initializer_list<std::string>& aliases,
        const std::string& description,
        bool* location
    )
    {
        PVK_ASSERT(location != nullptr);

        add_switch(aliases, description, [location](){ *location = true; });
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::add_switch(
        const std::string& name,
        const std::string& description,
        bool* location
    )
    {
        add_switch({name}, description, location);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::add_switch(
        const std::initializer_list<std::string>& aliases,
        const std::string& description,
        const std::function<void()>& callback
    )
    {
        PVK_ASSERT(aliases.size() > 0);

        generate_manual_entry(aliases, description, false);

        for(const auto& name : aliases)
            m_SwitchOptions[name] = callback;
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::add_switch(
        const std::string& name,
        const std::string& description,
        const std::function<void()>& callback
    )
    {
        add_switch({name}, description, callback);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::add_parser(
        const std::initializer_list<std::string>& aliases,
        const std::string& description,
        const std::function<bool(ArgQueue&)>& parser
    )
    {
        PVK_ASSERT(aliases.size() > 0);
        PVK_ASSERT(parser);

        generate_manual_entry(aliases, description, true);

        for(const auto& name : aliases)
            m_ParserOptions[name] = parser;
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::add_parser(
        const std::string& name,
        const std::string& description,
        const std::function<bool(ArgQueue&)>& parser
    )
    {
        add_parser({name}, description, parser);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline const std::string& OptionsParser::manual() const
    {
        return m_Manual;
    }

//---------------------------------------------------------------------------------------------------------------------

    inline std::string OptionsParser::manual(const std::string& option) const
    {
        PVK_ASSERT(m_ManualLookup.contains(option));

        const auto& [names, description] = m_ManualEntries[m_ManualLookup.at(option)];
        return names + '\t' + description;
    }

//---------------------------------------------------------------------------------------------------------------------

    inline bool OptionsParser::has_option(const std::string& name) const
    {
        return has_parser(name) || has_variable(name) || has_switch(name);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline bool OptionsParser::has_variable(const std::string& name) const
    {
        return m_VariableOptions.contains(name);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline bool OptionsParser::has_switch(const std::string& name) const
    {
        return m_SwitchOptions.contains(name);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline bool OptionsParser::has_parser(const std::string& name) const
    {
        return m_ParserOptions.contains(name);
    }

//---------------------------------------------------------------------------------------------------------------------

    inline bool OptionsParser::is_empty() const
    {
        return m_ParserOptions.empty() && m_VariableOptions.empty() && m_SwitchOptions.empty();
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::set_error_handler(const ErrorHandler& handler)
    {
        PVK_ASSERT(handler);

        m_ErrorHandler = handler;
    }

//---------------------------------------------------------------------------------------------------------------------

    inline void OptionsParser::generate_manual_entry(
        const std::initializer_list<std::string>& aliases,
        const std::string& description,
        const bool has_argument
    )
    {
        std::string names;
        for(const auto& name : aliases)
            names += names.empty() ? name : ", " + name;

        if(has_argument)
            names += " <arg>";

        m_LongestEntryLength = std::max(m_LongestEntryLength, names.length());

        const size_t index = m_ManualEntries.size();
        m_ManualEntries.emplace_back(names, description);
        for(const auto& name : aliases)
            m_ManualLookup[name] = index;

        // Rebuild so that every description stays aligned to the longest entry.
        m_Manual.clear();
        for(const auto& [entry_names, entry_description] : m_ManualEntries)
        {
            m_Manual += '\t';
            m_Manual += entry_names;
            m_Manual += std::string(m_LongestEntryLength - entry_names.length() + 4, ' ');
            m_Manual += entry_description;
            m_Manual += '\n';
        }
    }

//---------------------------------------------------------------------------------------------------------------------

}
