/*

response_parser.hpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <list>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Token of the response defined by the grammar.

Its type is determined by the content, and can be either atom, string literal or parenthesized list. Thus, it can be considered as union of
those three types.
**/
struct UIDBOX_EXPORT response_token_t
{
    /**
    Token type which can be empty in the case that is not determined yet, atom, string literal or parenthesized list.
    **/
    enum class token_type_t {EMPTY, ATOM, LITERAL, LIST} token_type;

    /**
    Token content in case it is atom.
    **/
    std::string atom;

    /**
    Token content in case it is string literal.
    **/
    std::string literal;

    /**
    String literal is first determined by its size, so it's stored here before reading the literal itself.
    **/
    std::string literal_size;

    /**
    Token content in case it is parenthesized list.

    It can store either of the three types, so the definition is recursive.
    **/
    std::list<std::shared_ptr<response_token_t>> parenthesized_list;

    response_token_t() : token_type(token_type_t::EMPTY)
    {
    }
};


using token_list_t = std::list<std::shared_ptr<response_token_t>>;


/**
Parsed elements of a response line.
**/
struct UIDBOX_EXPORT tag_result_response_t
{
    /**
    Possible response results.
    **/
    enum result_t {OK, NO, BAD};

    /**
    Tag of the response.
    **/
    std::string tag;

    /**
    Result of the response, if exists.
    **/
    std::optional<result_t> result;

    /**
    Rest of the response line.
    **/
    std::string response;

    /**
    Formatting the response line to a user friendly format.

    @return Response line as string.
    **/
    std::string to_string() const;
};


/**
Tokenizer of the response text.

The text is given piece by piece: a response carrying a string literal ends with the literal size marker, then the literal itself is
provided by `literal(const std::string&)`, then the text following the literal continues the same token sequence.
**/
class UIDBOX_EXPORT response_parser
{
public:

    response_parser();

    /**
    Parsing a line into tag, result and response which is the rest of the line.

    @param line       Response line to parse.
    @return           Tag, result and response.
    @throw malformed_response_error Parsing failure.
    **/
    static tag_result_response_t parse_tag_result(const std::string& line);

    /**
    Parsing the untagged records of a command, one parser per response.

    A record carrying a literal is continued by the next record, so both end up in the same parser.

    @param records Records as returned by the session.
    @return        Parser of each response, in the order received.
    @throw malformed_response_error Parser failure.
    **/
    static std::vector<response_parser> parse_records(const std::vector<response_record_t>& records);

    /**
    Finding the fetch response of the given message among the parsed responses.

    @param responses Parsed responses of a fetch or store command.
    @param uid       Message to look for.
    @return          Response carrying the `UID` item equal to the given one, or null if none does.
    **/
    static const response_parser* find_fetch(const std::vector<response_parser>& responses, unsigned long uid);

    /**
    Parsing a response (without tag and result) into optional and mandatory part.

    @param response Response piece to parse.
    @throw malformed_response_error Parser failure.
    **/
    void parse(const std::string& response);

    /**
    Checking whether the last piece ended by a literal size marker.

    @return True if the literal bytes are expected.
    **/
    bool literal_pending() const;

    /**
    Providing the bytes of the pending literal.

    @param bytes Literal content.
    @throw malformed_response_error No literal is pending or the size does not match.
    **/
    void literal(const std::string& bytes);

    /**
    Resetting the parser state to the initial one.
    **/
    void reset();

    /**
    Mandatory part of the response, which is any text outside of the square brackets.
    **/
    token_list_t& mandatory();

    /**
    Optional part of the response, determined by the square brackets.
    **/
    token_list_t& optional();

    /**
    Finding the value following the given atom key inside a parenthesized list, as in `(UID 5 FLAGS (\Seen))`.

    The top level tokens and the first level of the lists are searched.

    @param key Atom to look for, case insensitive.
    @return    Token following the key, or null if not found.
    **/
    std::shared_ptr<response_token_t> find_value(const std::string& key) const;

private:

    static const char TOKEN_SEPARATOR_CHAR{' '};

    static const char QUOTED_STRING_SEPARATOR_CHAR{'"'};

    static const char OPTIONAL_BEGIN{'['};

    static const char OPTIONAL_END{']'};

    static const char LIST_BEGIN{'('};

    static const char LIST_END{')'};

    static const char STRING_LITERAL_BEGIN{'{'};

    static const char STRING_LITERAL_END{'}'};

    static const char BACKSLASH_CHAR{'\\'};

    /**
    Finding last token of the list at the given depth in terms of parenthesis count.

    @param token_list Token sequence to traverse.
    @return           Last token list of the given sequence at the current depth of parenthesis count.
    **/
    token_list_t* find_last_token_list(token_list_t& token_list);

    token_list_t* current_token_list();

    token_list_t optional_part_;

    token_list_t mandatory_part_;

    bool optional_part_state_;

    enum class atom_state_t {NONE, PLAIN, QUOTED} atom_state_;

    /**
    Counting open parenthesis of a parenthized list, thus it also keeps parser state if a parenthesized list is reached.
    **/
    unsigned int parenthesis_list_counter_;

    enum class string_literal_state_t {NONE, SIZE, WAITING, READING} literal_state_;

    /**
    Literal token waiting for its content.
    **/
    std::shared_ptr<response_token_t> pending_literal_;
};


} // namespace uidbox
