/*

searcher_test.cpp
-----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE searcher_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/message.hpp>
#include <uidbox/searcher.hpp>
#include "fake_session.hpp"


using std::string;
using std::vector;
using uidbox::command_result_t;
using uidbox::parse_error;
using uidbox::protocol_error;
using uidbox::response_record_t;
using uidbox::searcher;
using uidbox::status_t;
using uidbox::FLAG_DELETED;
using uidbox::FLAG_SEEN;
using uidbox::test::fake_session;


namespace
{

const string RAW{"Subject: search\r\n\r\nText.\r\n"};


command_result_t search_response(const string& text)
{
    command_result_t result;
    result.status = status_t::OK;
    result.data.push_back(response_record_t{text, std::nullopt});
    return result;
}

} // anonymous namespace


BOOST_AUTO_TEST_CASE(all_messages_in_order)
{
    fake_session session;
    session.uid_next("INBOX", 5);
    session.deliver("INBOX", RAW);
    session.uid_next("INBOX", 9);
    session.deliver("INBOX", RAW);
    session.uid_next("INBOX", 12);
    session.deliver("INBOX", RAW);
    session.select("INBOX");
    searcher search(session);

    BOOST_CHECK(search.search() == (vector<unsigned long>{5, 9, 12}));
    BOOST_CHECK_EQUAL(session.requests.back(), "UID SEARCH (ALL)");
}


BOOST_AUTO_TEST_CASE(empty_folder)
{
    fake_session session;
    session.select("INBOX");
    searcher search(session);
    BOOST_CHECK(search.search("ALL").empty());
}


BOOST_AUTO_TEST_CASE(convenience_criteria)
{
    fake_session session;
    unsigned long seen = session.deliver("INBOX", RAW, {FLAG_SEEN});
    unsigned long unseen = session.deliver("INBOX", RAW);
    session.deliver("INBOX", RAW, {FLAG_DELETED});
    session.select("INBOX");
    searcher search(session);

    BOOST_CHECK(search.unseen_undeleted() == (vector<unsigned long>{unseen}));
    BOOST_CHECK_EQUAL(session.requests.back(), "UID SEARCH (UNSEEN UNDELETED)");
    BOOST_CHECK(search.all_undeleted() == (vector<unsigned long>{seen, unseen}));
    BOOST_CHECK_EQUAL(search.search("ALL").size(), 3u);
}


BOOST_AUTO_TEST_CASE(every_call_goes_to_server)
{
    fake_session session;
    session.deliver("INBOX", RAW);
    session.select("INBOX");
    searcher search(session);

    search.search();
    session.deliver("INBOX", RAW);
    BOOST_CHECK_EQUAL(search.search().size(), 2u);
    BOOST_CHECK_EQUAL(session.count("SEARCH"), 2u);
}


BOOST_AUTO_TEST_CASE(non_ok_status)
{
    fake_session session;
    session.select("INBOX");
    searcher search(session);

    BOOST_CHECK_THROW(search.search("BOGUS"), protocol_error);
    session.fail("SEARCH", status_t::NO);
    BOOST_CHECK_THROW(search.search(), protocol_error);
}


BOOST_AUTO_TEST_CASE(malformed_list)
{
    fake_session session;
    session.select("INBOX");
    searcher search(session);

    session.script("SEARCH", search_response("5 nine 12"));
    BOOST_CHECK_THROW(search.search(), parse_error);

    session.script("SEARCH", search_response("5 (9"));
    BOOST_CHECK_THROW(search.search(), parse_error);

    session.script("SEARCH", search_response("7 (MODSEQ 3)"));
    BOOST_CHECK_THROW(search.search(), parse_error);
}


BOOST_AUTO_TEST_CASE(several_records)
{
    fake_session session;
    session.select("INBOX");
    searcher search(session);

    command_result_t result = search_response("3 4");
    result.data.push_back(response_record_t{"8", std::nullopt});
    session.script("SEARCH", result);
    BOOST_CHECK(search.search() == (vector<unsigned long>{3, 4, 8}));
}
