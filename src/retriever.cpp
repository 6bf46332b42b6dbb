/*

retriever.cpp
-------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <utility>
#include <vector>
#include <uidbox/errors.hpp>
#include <uidbox/response_parser.hpp>
#include <uidbox/retriever.hpp>


using std::move;
using std::string;
using std::to_string;
using std::vector;


namespace uidbox
{


retriever::retriever(session_port& session, message_cache& cache, flag_controller& flags, message_factory_t factory) :
    session_(session), cache_(cache), flags_(flags), factory_(move(factory))
{
}


message_view retriever::get_full(unsigned long uid)
{
    const string raw = cache_.fetch(uid);
    return assemble(uid, raw, false);
}


message_view retriever::get_header_only(unsigned long uid)
{
    const string raw = fetch_header(uid);
    return assemble(uid, raw, true);
}


string retriever::fetch_header(unsigned long uid)
{
    command_result_t result = session_.uid_command("FETCH", {to_string(uid), "(BODY.PEEK[HEADER])"});
    if (!result.ok())
        throw protocol_error("Fetching header failure.", "UID=" + to_string(uid) + ", response=`" + result.response + "`.");

    vector<response_parser> responses = response_parser::parse_records(result.data);
    const response_parser* fetched = response_parser::find_fetch(responses, uid);
    if (fetched == nullptr)
        throw no_such_message_error("No such message.", "UID=" + to_string(uid) + ".");
    // The peek is answered without the peek keyword.
    auto header = fetched->find_value("BODY[HEADER]");
    if (header == nullptr)
        throw malformed_response_error("Header not found in the fetch response.", "UID=" + to_string(uid) + ".");
    if (header->token_type == response_token_t::token_type_t::LITERAL)
        return header->literal;
    if (header->token_type == response_token_t::token_type_t::ATOM)
        return header->atom;
    throw malformed_response_error("Header not found in the fetch response.", "UID=" + to_string(uid) + ".");
}


void retriever::factory(message_factory_t factory)
{
    factory_ = move(factory);
}


message_view retriever::assemble(unsigned long uid, const string& raw, bool header_only)
{
    message_view view{message(raw)};
    view.uid = uid;
    view.header_only = header_only;
    view.flags = flags_.get_flags(uid);
    view.internal_date = flags_.internal_date(uid);
    view.size = flags_.size(uid);
    if (factory_)
        return factory_(move(view));
    return view;
}


} // namespace uidbox
