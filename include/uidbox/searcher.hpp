/*

searcher.hpp
------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <vector>
#include "session_port.hpp"
#include "export.hpp"


namespace uidbox
{


/**
UID search over the selected folder.

Criteria are passed to the server as they are, nothing is cached.
**/
class UIDBOX_EXPORT searcher
{
public:

    /**
    @param session Session to search through, must outlive the searcher.
    **/
    explicit searcher(session_port& session);

    searcher(const searcher&) = delete;

    searcher(searcher&&) = delete;

    ~searcher() = default;

    void operator=(const searcher&) = delete;

    void operator=(searcher&&) = delete;

    /**
    Searching the messages matching the criteria.

    @param criteria Search criteria such as `UNSEEN FROM "alice"`.
    @return         UIDs in the order returned by the server.
    @throw protocol_error Search status is not OK.
    @throw parse_error    Response is not a list of numbers.
    @throw *              `session_port::uid_command(const std::string&, const std::vector<std::string>&)`.
    **/
    std::vector<unsigned long> search(const std::string& criteria = "ALL");

    /**
    Searching the unseen messages not flagged as deleted.

    @return UIDs found.
    @throw * `search(const std::string&)`.
    **/
    std::vector<unsigned long> unseen_undeleted();

    /**
    Searching the messages not flagged as deleted.

    @return UIDs found.
    @throw * `search(const std::string&)`.
    **/
    std::vector<unsigned long> all_undeleted();

private:

    session_port& session_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
