/*

searcher.cpp
------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>
#include <uidbox/errors.hpp>
#include <uidbox/response_parser.hpp>
#include <uidbox/searcher.hpp>


using std::stoul;
using std::string;
using std::vector;


namespace uidbox
{


searcher::searcher(session_port& session) : session_(session)
{
}


vector<unsigned long> searcher::search(const string& criteria)
{
    command_result_t result = session_.uid_command("SEARCH", {"(" + criteria + ")"});
    if (!result.ok())
        throw protocol_error("Search failure.", "Criteria=`" + criteria + "`, response=`" + result.response + "`.");

    vector<unsigned long> uids;
    for (const auto& record : result.data)
    {
        if (record.literal.has_value())
            throw parse_error("Unexpected literal in search response.", "Text=`" + record.text + "`.");

        response_parser parser;
        try
        {
            parser.parse(record.text);
        }
        catch (const malformed_response_error& exc)
        {
            throw parse_error("Parsing search response failure.", exc.details());
        }
        for (const auto& token : parser.mandatory())
        {
            const string& atom = token->atom;
            if (token->token_type != response_token_t::token_type_t::ATOM || atom.empty() ||
                !std::all_of(atom.begin(), atom.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)); }))
                throw parse_error("Parsing search response failure.", "Text=`" + record.text + "`.");
            try
            {
                uids.push_back(stoul(atom));
            }
            catch (const std::out_of_range& exc)
            {
                throw parse_error("UID out of range.", exc.what());
            }
        }
    }
    return uids;
}


vector<unsigned long> searcher::unseen_undeleted()
{
    return search("UNSEEN UNDELETED");
}


vector<unsigned long> searcher::all_undeleted()
{
    return search("UNDELETED");
}


} // namespace uidbox
