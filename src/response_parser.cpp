/*

response_parser.cpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cctype>
#include <string>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/response_parser.hpp>


using std::make_optional;
using std::make_shared;
using std::shared_ptr;
using std::stoul;
using std::string;
using std::to_string;
using std::vector;
using boost::iequals;
using boost::trim;


namespace uidbox
{


string tag_result_response_t::to_string() const
{
    string result_s;
    if (result.has_value())
    {
        switch (result.value())
        {
        case OK:
            result_s = "OK";
            break;

        case NO:
            result_s = "NO";
            break;

        case BAD:
            result_s = "BAD";
            break;

        default:
            break;
        }
    }
    else
        result_s = "<null>";
    return tag + " " + result_s + " " + response;
}


response_parser::response_parser() : optional_part_state_(false), atom_state_(atom_state_t::NONE), parenthesis_list_counter_(0),
    literal_state_(string_literal_state_t::NONE)
{
}


tag_result_response_t response_parser::parse_tag_result(const string& line)
{
    string::size_type tag_pos = line.find(TOKEN_SEPARATOR_CHAR);
    if (tag_pos == string::npos)
        throw malformed_response_error("Parsing failure.", "Line=`" + line + "`.");

    tag_result_response_t parsed;
    parsed.tag = line.substr(0, tag_pos);

    string::size_type result_pos = line.find(TOKEN_SEPARATOR_CHAR, tag_pos + 1);
    string result_s = line.substr(tag_pos + 1, result_pos == string::npos ? string::npos : result_pos - tag_pos - 1);
    if (iequals(result_s, "OK"))
        parsed.result = make_optional(tag_result_response_t::OK);
    else if (iequals(result_s, "NO"))
        parsed.result = make_optional(tag_result_response_t::NO);
    else if (iequals(result_s, "BAD"))
        parsed.result = make_optional(tag_result_response_t::BAD);

    if (!parsed.result.has_value())
        parsed.response = line.substr(tag_pos + 1);
    else if (result_pos != string::npos)
        parsed.response = line.substr(result_pos + 1);
    return parsed;
}


/*
Protocol grammar defines the response as sequence of atoms, string literals and parenthesized list (which itself can contain atoms, string
literal and parenthesized lists). The grammar can be parsed in one pass by counting which token is read:
1. if a square bracket is reached, then an optional part is found, so parse its content as usual
2. if a brace is read, then string literal size is found, so read a number and then wait for the literal itself
3. if a parenthesis is found, then a list is being read, so increase the parenthesis counter and proceed
4. for a regular char check the state and determine if an atom or string size is read

When a character is read, it belongs to the last token of the sequence of tokens at the given parenthesis depth.

The bracket of a fetch section as in `BODY[HEADER]` directly follows an atom, so it is kept within the atom instead of opening the optional part.
*/
void response_parser::parse(const string& response)
{
    if (literal_state_ == string_literal_state_t::READING)
        throw malformed_response_error("Parser failure.", "Literal expected.");

    token_list_t* token_list = nullptr;
    shared_ptr<response_token_t> cur_token;
    for (auto ch : response)
    {
        switch (ch)
        {
            case OPTIONAL_BEGIN:
            {
                if (atom_state_ == atom_state_t::QUOTED || atom_state_ == atom_state_t::PLAIN)
                    cur_token->atom += ch;
                else
                {
                    if (optional_part_state_)
                        throw malformed_response_error("Parser failure.", "Nested optional part.");
                    optional_part_state_ = true;
                }
            }
            break;

            case OPTIONAL_END:
            {
                if (atom_state_ == atom_state_t::QUOTED || (atom_state_ == atom_state_t::PLAIN && cur_token->atom.find(OPTIONAL_BEGIN) != string::npos))
                    cur_token->atom += ch;
                else
                {
                    if (!optional_part_state_)
                        throw malformed_response_error("Parser failure.", "Unbalanced optional part.");
                    optional_part_state_ = false;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case LIST_BEGIN:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    cur_token = make_shared<response_token_t>();
                    cur_token->token_type = response_token_t::token_type_t::LIST;
                    token_list = current_token_list();
                    token_list->push_back(cur_token);
                    parenthesis_list_counter_++;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case LIST_END:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (parenthesis_list_counter_ == 0)
                        throw malformed_response_error("Parser failure.", "Unbalanced parenthesis.");
                    parenthesis_list_counter_--;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case STRING_LITERAL_BEGIN:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (literal_state_ == string_literal_state_t::SIZE)
                        throw malformed_response_error("Parser failure.", "Nested literal size.");
                    cur_token = make_shared<response_token_t>();
                    cur_token->token_type = response_token_t::token_type_t::LITERAL;
                    token_list = current_token_list();
                    token_list->push_back(cur_token);
                    literal_state_ = string_literal_state_t::SIZE;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case STRING_LITERAL_END:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (literal_state_ != string_literal_state_t::SIZE || cur_token->literal_size.empty())
                        throw malformed_response_error("Parser failure.", "Literal size expected.");
                    literal_state_ = string_literal_state_t::WAITING;
                    pending_literal_ = cur_token;
                }
            }
            break;

            case TOKEN_SEPARATOR_CHAR:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else if (cur_token != nullptr)
                {
                    trim(cur_token->atom);
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case QUOTED_STRING_SEPARATOR_CHAR:
            {
                if (atom_state_ == atom_state_t::NONE)
                {
                    cur_token = make_shared<response_token_t>();
                    cur_token->token_type = response_token_t::token_type_t::ATOM;
                    token_list = current_token_list();
                    token_list->push_back(cur_token);
                    atom_state_ = atom_state_t::QUOTED;
                }
                else if (atom_state_ == atom_state_t::QUOTED)
                {
                    // The backslash and a double quote within an atom is the double quote only.
                    if (cur_token->atom.empty() || cur_token->atom.back() != BACKSLASH_CHAR)
                        atom_state_ = atom_state_t::NONE;
                    else
                        cur_token->atom.back() = ch;
                }
                else
                    cur_token->atom += ch;
            }
            break;

            default:
            {
                // Double backslash in a quoted atom is translated to the single backslash.
                if (ch == BACKSLASH_CHAR && atom_state_ == atom_state_t::QUOTED && !cur_token->atom.empty() && cur_token->atom.back() == BACKSLASH_CHAR)
                    break;

                if (literal_state_ == string_literal_state_t::SIZE)
                {
                    if (!isdigit(static_cast<unsigned char>(ch)))
                        throw malformed_response_error("Parser failure.", "Digit expected in literal size.");
                    cur_token->literal_size += ch;
                }
                else if (literal_state_ == string_literal_state_t::WAITING)
                {
                    // no characters allowed after the right brace, crlf is required
                    throw malformed_response_error("Parser failure.", "Text after literal size.");
                }
                else
                {
                    if (atom_state_ == atom_state_t::NONE)
                    {
                        cur_token = make_shared<response_token_t>();
                        cur_token->token_type = response_token_t::token_type_t::ATOM;
                        token_list = current_token_list();
                        token_list->push_back(cur_token);
                        atom_state_ = atom_state_t::PLAIN;
                    }
                    cur_token->atom += ch;
                }
            }
        }
    }

    if (atom_state_ == atom_state_t::QUOTED)
        throw malformed_response_error("Parser failure.", "Unterminated quoted string.");
    atom_state_ = atom_state_t::NONE;
    if (literal_state_ == string_literal_state_t::SIZE)
        throw malformed_response_error("Parser failure.", "Unterminated literal size.");
    if (literal_state_ == string_literal_state_t::WAITING)
        literal_state_ = string_literal_state_t::READING;
}


vector<response_parser> response_parser::parse_records(const vector<response_record_t>& records)
{
    vector<response_parser> responses;
    bool continued = false;
    for (const auto& record : records)
    {
        if (!continued)
            responses.emplace_back();
        response_parser& parser = responses.back();
        parser.parse(record.text);
        continued = record.literal.has_value();
        if (continued)
            parser.literal(record.literal.value());
    }
    return responses;
}


const response_parser* response_parser::find_fetch(const vector<response_parser>& responses, unsigned long uid)
{
    const string uid_str = to_string(uid);
    for (const auto& parser : responses)
    {
        auto value = parser.find_value("UID");
        if (value != nullptr && value->token_type == response_token_t::token_type_t::ATOM && value->atom == uid_str)
            return &parser;
    }
    return nullptr;
}


bool response_parser::literal_pending() const
{
    return literal_state_ == string_literal_state_t::READING;
}


void response_parser::literal(const string& bytes)
{
    if (!literal_pending() || pending_literal_ == nullptr)
        throw malformed_response_error("Parser failure.", "No literal expected.");
    try
    {
        if (stoul(pending_literal_->literal_size) != bytes.size())
            throw malformed_response_error("Parser failure.", "Literal size " + pending_literal_->literal_size + " does not match " +
                to_string(bytes.size()) + " bytes.");
    }
    catch (const std::out_of_range& exc)
    {
        throw malformed_response_error("Parser failure.", exc.what());
    }
    pending_literal_->literal = bytes;
    pending_literal_ = nullptr;
    literal_state_ = string_literal_state_t::NONE;
}


void response_parser::reset()
{
    optional_part_.clear();
    mandatory_part_.clear();
    optional_part_state_ = false;
    atom_state_ = atom_state_t::NONE;
    parenthesis_list_counter_ = 0;
    literal_state_ = string_literal_state_t::NONE;
    pending_literal_ = nullptr;
}


token_list_t& response_parser::mandatory()
{
    return mandatory_part_;
}


token_list_t& response_parser::optional()
{
    return optional_part_;
}


shared_ptr<response_token_t> response_parser::find_value(const string& key) const
{
    auto scan = [&key](const token_list_t& tokens) -> shared_ptr<response_token_t>
    {
        for (auto token = tokens.begin(); token != tokens.end(); ++token)
            if ((*token)->token_type == response_token_t::token_type_t::ATOM && iequals((*token)->atom, key))
            {
                auto next = token;
                ++next;
                if (next != tokens.end())
                    return *next;
            }
        return nullptr;
    };

    auto found = scan(mandatory_part_);
    if (found != nullptr)
        return found;
    for (const auto& part : mandatory_part_)
        if (part->token_type == response_token_t::token_type_t::LIST)
        {
            found = scan(part->parenthesized_list);
            if (found != nullptr)
                return found;
        }
    return nullptr;
}


token_list_t* response_parser::find_last_token_list(token_list_t& token_list)
{
    token_list_t* list_ptr = &token_list;
    unsigned int depth = 1;
    while (!list_ptr->empty() && list_ptr->back()->token_type == response_token_t::token_type_t::LIST && depth <= parenthesis_list_counter_)
    {
        list_ptr = &(list_ptr->back()->parenthesized_list);
        depth++;
    }
    return list_ptr;
}


token_list_t* response_parser::current_token_list()
{
    return optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
}


} // namespace uidbox
