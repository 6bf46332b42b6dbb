/*

flag_controller_test.cpp
------------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE flag_controller_test

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/test/unit_test.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/flag_controller.hpp>
#include "fake_session.hpp"


using std::string;
using std::to_string;
using boost::posix_time::time_from_string;
using uidbox::command_result_t;
using uidbox::flag_controller;
using uidbox::flag_error;
using uidbox::flag_set_t;
using uidbox::malformed_response_error;
using uidbox::no_such_message_error;
using uidbox::protocol_error;
using uidbox::response_record_t;
using uidbox::status_t;
using uidbox::FLAG_DELETED;
using uidbox::FLAG_DRAFT;
using uidbox::FLAG_FLAGGED;
using uidbox::FLAG_SEEN;
using uidbox::test::fake_session;


namespace
{

const string RAW{"From: carol@example.com\r\nSubject: flags\r\n\r\nFlag me.\r\n"};


command_result_t fetch_response(const string& text)
{
    command_result_t result;
    result.status = status_t::OK;
    result.data.push_back(response_record_t{text, std::nullopt});
    return result;
}

} // anonymous namespace


BOOST_AUTO_TEST_CASE(add_and_remove_flag)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW);
    session.select("INBOX");
    flag_controller flags(session);

    BOOST_CHECK(flags.get_flags(uid).empty());
    flags.add_flags(uid, {FLAG_FLAGGED});
    BOOST_CHECK(flags.get_flags(uid) == flag_set_t{FLAG_FLAGGED});
    flags.remove_flags(uid, {FLAG_FLAGGED});
    BOOST_CHECK(flags.get_flags(uid).empty());
}


BOOST_AUTO_TEST_CASE(one_store_per_flag)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW);
    session.select("INBOX");
    flag_controller flags(session);

    flags.add_flags(uid, {FLAG_SEEN, "$Important"});
    BOOST_CHECK_EQUAL(session.count("STORE"), 2u);
    BOOST_CHECK_EQUAL(session.requests.back(), "UID STORE " + to_string(uid) + " +FLAGS ($Important)");
    BOOST_CHECK(flags.get_flags(uid) == (flag_set_t{FLAG_SEEN, "$Important"}));
}


BOOST_AUTO_TEST_CASE(set_replaces_flags)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW, {FLAG_SEEN, FLAG_DRAFT});
    session.select("INBOX");
    flag_controller flags(session);

    flags.set_flags(uid, {FLAG_FLAGGED, FLAG_SEEN});
    BOOST_CHECK_EQUAL(session.count("STORE"), 1u);
    BOOST_CHECK(flags.get_flags(uid) == (flag_set_t{FLAG_FLAGGED, FLAG_SEEN}));

    flags.set_flags(uid, {});
    BOOST_CHECK(flags.get_flags(uid).empty());
}


BOOST_AUTO_TEST_CASE(partial_failure_names_flag)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW);
    session.select("INBOX");
    flag_controller flags(session);
    session.fail_flag(FLAG_DRAFT);

    BOOST_CHECK_EXCEPTION(flags.add_flags(uid, {FLAG_SEEN, FLAG_DRAFT, FLAG_FLAGGED}), flag_error,
        [](const flag_error& exc) { return exc.flag() == FLAG_DRAFT; });
    BOOST_CHECK(flags.get_flags(uid) == flag_set_t{FLAG_SEEN});
    BOOST_CHECK_THROW(flags.remove_flags(uid, {FLAG_DRAFT}), protocol_error);
}


BOOST_AUTO_TEST_CASE(set_failure)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW);
    session.select("INBOX");
    flag_controller flags(session);

    session.fail("STORE");
    BOOST_CHECK_THROW(flags.set_flags(uid, {FLAG_DELETED}), protocol_error);
}


BOOST_AUTO_TEST_CASE(size_and_internal_date)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW, {}, time_from_string("2019-05-04 13:14:15"));
    session.select("INBOX");
    flag_controller flags(session);

    BOOST_CHECK_EQUAL(flags.size(uid), RAW.size());
    BOOST_CHECK(flags.internal_date(uid) == time_from_string("2019-05-04 13:14:15"));
}


BOOST_AUTO_TEST_CASE(missing_message)
{
    fake_session session;
    session.select("INBOX");
    flag_controller flags(session);

    BOOST_CHECK_THROW(flags.get_flags(3), no_such_message_error);
    BOOST_CHECK_THROW(flags.size(3), no_such_message_error);
    BOOST_CHECK_THROW(flags.internal_date(3), no_such_message_error);
}


BOOST_AUTO_TEST_CASE(non_ok_status)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW);
    session.select("INBOX");
    flag_controller flags(session);

    session.fail("FETCH", status_t::BAD);
    BOOST_CHECK_THROW(flags.get_flags(uid), protocol_error);
    session.fail("FETCH");
    BOOST_CHECK_THROW(flags.size(uid), protocol_error);
}


BOOST_AUTO_TEST_CASE(malformed_responses)
{
    fake_session session;
    unsigned long uid = session.deliver("INBOX", RAW);
    session.select("INBOX");
    flag_controller flags(session);
    const string prefix = "1 (UID " + to_string(uid) + " ";

    session.script("FETCH", fetch_response(prefix + "FLAGS \\Seen)"));
    BOOST_CHECK_THROW(flags.get_flags(uid), malformed_response_error);

    session.script("FETCH", fetch_response(prefix + "FLAGS (\\Seen)))"));
    BOOST_CHECK_THROW(flags.get_flags(uid), malformed_response_error);

    session.script("FETCH", fetch_response(prefix + "RFC822.SIZE big)"));
    BOOST_CHECK_THROW(flags.size(uid), malformed_response_error);

    session.script("FETCH", fetch_response(prefix + "INTERNALDATE \"not a date\")"));
    BOOST_CHECK_THROW(flags.internal_date(uid), malformed_response_error);

    session.script("FETCH", fetch_response("1 (UID " + to_string(uid) + ")"));
    BOOST_CHECK_THROW(flags.size(uid), malformed_response_error);
}
