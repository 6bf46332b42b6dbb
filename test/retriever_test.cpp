/*

retriever_test.cpp
------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE retriever_test

#include <algorithm>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/test/unit_test.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/flag_controller.hpp>
#include <uidbox/message_cache.hpp>
#include <uidbox/retriever.hpp>
#include "fake_session.hpp"


using std::string;
using boost::posix_time::time_from_string;
using uidbox::flag_controller;
using uidbox::flag_set_t;
using uidbox::message_cache;
using uidbox::message_view;
using uidbox::no_such_message_error;
using uidbox::protocol_error;
using uidbox::retriever;
using uidbox::FLAG_FLAGGED;
using uidbox::FLAG_SEEN;
using uidbox::test::fake_session;


namespace
{

const string RAW{"From: dave@example.com\r\nSubject: Quarterly numbers\r\n\r\nAll good.\r\n"};


struct fixture
{
    fixture() : cache(session), flags(session), retrieve(session, cache, flags)
    {
        uid = session.deliver("INBOX", RAW, {FLAG_FLAGGED}, time_from_string("2022-11-30 08:00:00"));
        session.select("INBOX");
        session.reset_counts();
    }

    unsigned count_requests(const string& item) const
    {
        return static_cast<unsigned>(std::count_if(session.requests.begin(), session.requests.end(),
            [&item](const string& request) { return request.find(item) != string::npos; }));
    }

    fake_session session;
    message_cache cache;
    flag_controller flags;
    retriever retrieve;
    unsigned long uid;
};

} // anonymous namespace


BOOST_FIXTURE_TEST_CASE(full_message, fixture)
{
    message_view view = retrieve.get_full(uid);
    BOOST_CHECK_EQUAL(view.uid, uid);
    BOOST_CHECK(!view.header_only);
    BOOST_CHECK_EQUAL(view.content.subject(), "Quarterly numbers");
    BOOST_CHECK_EQUAL(view.content.body(), "All good.\r\n");
    BOOST_CHECK(view.flags == (flag_set_t{FLAG_FLAGGED, FLAG_SEEN}));
    BOOST_CHECK_EQUAL(view.size, RAW.size());
    BOOST_REQUIRE(view.internal_date.has_value());
    BOOST_CHECK(view.internal_date.value() == time_from_string("2022-11-30 08:00:00"));
    BOOST_CHECK_EQUAL(session.count("FETCH"), 4u);
    BOOST_CHECK_EQUAL(session.requests.front(), "UID FETCH " + std::to_string(uid) + " (RFC822)");
}


BOOST_FIXTURE_TEST_CASE(full_message_cached, fixture)
{
    retrieve.get_full(uid);
    retrieve.get_full(uid);
    BOOST_CHECK_EQUAL(count_requests("(RFC822)"), 1u);
    BOOST_CHECK_EQUAL(count_requests("(FLAGS)"), 2u);
}


BOOST_FIXTURE_TEST_CASE(header_only_bypasses_cache, fixture)
{
    retrieve.get_full(uid);
    message_view header = retrieve.get_header_only(uid);
    BOOST_CHECK(header.header_only);
    BOOST_CHECK_EQUAL(header.content.subject(), "Quarterly numbers");
    BOOST_CHECK(header.content.body().empty());
    BOOST_CHECK(cache.holds(uid));

    retrieve.get_full(uid);
    BOOST_CHECK_EQUAL(count_requests("(RFC822)"), 1u);
    BOOST_CHECK_EQUAL(count_requests("(BODY.PEEK[HEADER])"), 1u);
}


BOOST_FIXTURE_TEST_CASE(header_does_not_mark_seen, fixture)
{
    message_view header = retrieve.get_header_only(uid);
    BOOST_CHECK(header.flags == flag_set_t{FLAG_FLAGGED});
    BOOST_CHECK_EQUAL(retrieve.fetch_header(uid), "From: dave@example.com\r\nSubject: Quarterly numbers\r\n\r\n");
}


BOOST_FIXTURE_TEST_CASE(missing_message_short_circuits, fixture)
{
    BOOST_CHECK_THROW(retrieve.get_full(uid + 100), no_such_message_error);
    BOOST_CHECK_EQUAL(session.count("FETCH"), 1u);
    BOOST_CHECK_THROW(retrieve.get_header_only(uid + 100), no_such_message_error);
    BOOST_CHECK_EQUAL(session.count("FETCH"), 2u);
}


BOOST_FIXTURE_TEST_CASE(header_fetch_failure, fixture)
{
    session.fail("FETCH");
    BOOST_CHECK_THROW(retrieve.get_header_only(uid), protocol_error);
}


BOOST_FIXTURE_TEST_CASE(factory_transforms_view, fixture)
{
    retrieve.factory([](message_view view)
    {
        view.content.add_header("X-Mailbox-Uid", std::to_string(view.uid));
        return view;
    });

    message_view view = retrieve.get_full(uid);
    BOOST_CHECK_EQUAL(view.content.header("X-Mailbox-Uid"), std::to_string(uid));
    message_view header = retrieve.get_header_only(uid);
    BOOST_CHECK(header.content.has_header("X-Mailbox-Uid"));
}
