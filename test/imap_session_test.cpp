/*

imap_session_test.cpp
---------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_session_test

#include <istream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/test/unit_test.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/imap_session.hpp>
#include <uidbox/mailbox.hpp>


using std::string;
using std::to_string;
using std::vector;
using boost::asio::ip::tcp;
using boost::algorithm::replace_all_copy;
using uidbox::command_result_t;
using uidbox::imap_session;
using uidbox::mailbox;
using uidbox::no_such_folder_error;
using uidbox::protocol_error;
using uidbox::status_t;


namespace
{

const string RAW{"From: heidi@example.com\r\nSubject: wire\r\n\r\nOver the wire.\r\n"};


/**
Server on the loopback interface answering each request line with the next scripted reply, where `$TAG` stands for the request tag.

A request ending with the literal size is answered by the continuation and the literal is read before the reply.
**/
class scripted_server
{
public:

    explicit scripted_server(vector<string> replies) : acceptor_(ctx_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
        replies_(std::move(replies))
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { serve(); });
    }

    ~scripted_server()
    {
        if (thread_.joinable())
            thread_.join();
    }

    unsigned port() const
    {
        return port_;
    }

    /**
    Waiting for the script to finish and getting the received lines.
    **/
    const vector<string>& received()
    {
        if (thread_.joinable())
            thread_.join();
        return received_;
    }

    const string& literal() const
    {
        return literal_;
    }

    const string& error() const
    {
        return error_;
    }

private:

    void serve()
    {
        try
        {
            tcp::socket socket(ctx_);
            acceptor_.accept(socket);
            boost::asio::streambuf buf;
            std::istream stream(&buf);
            write(socket, "* OK IMAP4rev1 server ready\r\n");

            for (const auto& reply : replies_)
            {
                string line = read_line(socket, buf, stream);
                received_.push_back(line);
                string tag = line.substr(0, line.find(' '));

                string::size_type brace = line.rfind('{');
                if (!line.empty() && line.back() == '}' && brace != string::npos)
                {
                    std::size_t size = std::stoul(line.substr(brace + 1, line.size() - brace - 2));
                    write(socket, "+ Ready for literal data\r\n");
                    if (buf.size() < size + 2)
                        boost::asio::read(socket, buf, boost::asio::transfer_exactly(size + 2 - buf.size()));
                    literal_.resize(size);
                    stream.read(&literal_[0], static_cast<std::streamsize>(size));
                    string crlf;
                    std::getline(stream, crlf);
                }
                write(socket, replace_all_copy(reply, "$TAG", tag) + "\r\n");
            }
        }
        catch (const std::exception& exc)
        {
            error_ = exc.what();
        }
    }

    static string read_line(tcp::socket& socket, boost::asio::streambuf& buf, std::istream& stream)
    {
        boost::asio::read_until(socket, buf, "\r\n");
        string line;
        std::getline(stream, line);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }

    static void write(tcp::socket& socket, const string& text)
    {
        boost::asio::write(socket, boost::asio::buffer(text));
    }

    boost::asio::io_context ctx_;
    tcp::acceptor acceptor_;
    unsigned port_;
    vector<string> replies_;
    vector<string> received_;
    string literal_;
    string error_;
    std::thread thread_;
};


imap_session::options_t local_options(unsigned port)
{
    imap_session::options_t options;
    options.hostname = "127.0.0.1";
    options.port = port;
    options.username = "user";
    options.password = "secret";
    options.session_name = "test";
    return options;
}

} // anonymous namespace


BOOST_AUTO_TEST_CASE(commands_and_responses)
{
    const string fetch_reply = "* 4 EXISTS\r\n* 1 FETCH (UID 5 RFC822 {" + to_string(RAW.size()) + "}\r\n" + RAW + ")\r\n$TAG OK FETCH completed";
    scripted_server server({
        "$TAG OK LOGIN completed",
        "* 3 EXISTS\r\n* OK [UIDVALIDITY 7] UIDs valid\r\n$TAG OK [READ-WRITE] SELECT completed",
        "* SEARCH 5 9 12\r\n$TAG OK SEARCH completed",
        fetch_reply,
        "$TAG OK FETCH completed",
        "* 1 FETCH (UID 5 FLAGS (\\Seen \\Deleted))\r\n$TAG OK STORE completed",
        "$TAG NO [TRYCREATE] No such mailbox",
        "* 3 EXPUNGE\r\n$TAG OK EXPUNGE completed",
        "* BYE Logging out\r\n$TAG OK LOGOUT completed"});

    imap_session session(local_options(server.port()));
    session.login();
    session.select("INBOX");
    BOOST_CHECK_EQUAL(session.selected(), "INBOX");

    command_result_t search = session.uid_command("SEARCH", {"(ALL)"});
    BOOST_CHECK(search.ok());
    BOOST_REQUIRE_EQUAL(search.data.size(), 1u);
    BOOST_CHECK_EQUAL(search.data[0].text, "5 9 12");

    command_result_t fetch = session.uid_command("FETCH", {"5", "(RFC822)"});
    BOOST_CHECK(fetch.ok());
    BOOST_REQUIRE_EQUAL(fetch.data.size(), 2u);
    BOOST_CHECK_EQUAL(fetch.data[0].text, "1 (UID 5 RFC822 {" + to_string(RAW.size()) + "}");
    BOOST_REQUIRE(fetch.data[0].literal.has_value());
    BOOST_CHECK_EQUAL(fetch.data[0].literal.value(), RAW);
    BOOST_CHECK_EQUAL(fetch.data[1].text, ")");

    command_result_t absent = session.uid_command("FETCH", {"6", "(RFC822)"});
    BOOST_CHECK(absent.ok());
    BOOST_CHECK(absent.data.empty());

    command_result_t store = session.uid_command("STORE", {"5", "+FLAGS", "(\\Deleted)"});
    BOOST_REQUIRE_EQUAL(store.data.size(), 1u);
    BOOST_CHECK_EQUAL(store.data[0].text, "1 (UID 5 FLAGS (\\Seen \\Deleted))");

    command_result_t copy = session.uid_command("COPY", {"5", "\"Nowhere\""});
    BOOST_CHECK(copy.status == status_t::NO);
    BOOST_CHECK_EQUAL(copy.response, "[TRYCREATE] No such mailbox");

    BOOST_CHECK(session.expunge().ok());
    session.logout();

    const vector<string>& received = server.received();
    BOOST_CHECK_EQUAL(server.error(), "");
    BOOST_CHECK(received == (vector<string>{
        "1 LOGIN \"user\" \"secret\"",
        "2 SELECT \"INBOX\"",
        "3 UID SEARCH (ALL)",
        "4 UID FETCH 5 (RFC822)",
        "5 UID FETCH 6 (RFC822)",
        "6 UID STORE 5 +FLAGS (\\Deleted)",
        "7 UID COPY 5 \"Nowhere\"",
        "8 EXPUNGE",
        "9 LOGOUT"}));
}


BOOST_AUTO_TEST_CASE(failures)
{
    scripted_server server({
        "$TAG NO LOGIN failed",
        "$TAG NO [NONEXISTENT] Mailbox does not exist",
        "$TAG BAD Invalid folder name",
        "$TAG NO Mailbox exists"});

    imap_session session(local_options(server.port()));
    BOOST_CHECK_THROW(session.login(), protocol_error);
    BOOST_CHECK_THROW(session.select("Missing"), no_such_folder_error);
    BOOST_CHECK_THROW(session.select("Bad/Name"), protocol_error);
    BOOST_CHECK_THROW(session.create("INBOX"), protocol_error);
    BOOST_CHECK(session.selected().empty());
    BOOST_CHECK_EQUAL(server.received().size(), 4u);
    BOOST_CHECK_EQUAL(server.error(), "");
}


BOOST_AUTO_TEST_CASE(refused_select_lists_folder)
{
    scripted_server server({
        "$TAG OK SELECT completed",
        "$TAG NO Permission denied",
        "* LIST (\\HasNoChildren) \"/\" \"Shared Private\"\r\n$TAG OK LIST completed",
        "$TAG NO No such mailbox",
        "* LIST (\\HasNoChildren) \"/\" \"Gone/Child\"\r\n$TAG OK LIST completed"});

    imap_session session(local_options(server.port()));
    session.select("INBOX");
    BOOST_CHECK_EQUAL(session.selected(), "INBOX");
    BOOST_CHECK_THROW(session.select("Shared Private"), protocol_error);
    BOOST_CHECK(session.selected().empty());
    BOOST_CHECK_THROW(session.select("Gone"), no_such_folder_error);

    const vector<string>& received = server.received();
    BOOST_CHECK_EQUAL(server.error(), "");
    BOOST_CHECK(received == (vector<string>{
        "1 SELECT \"INBOX\"",
        "2 SELECT \"Shared Private\"",
        "3 LIST \"\" \"Shared Private\"",
        "4 SELECT \"Gone\"",
        "5 LIST \"\" \"Gone\""}));
}


BOOST_AUTO_TEST_CASE(append_with_literal)
{
    scripted_server server({
        "$TAG OK LOGIN completed",
        "$TAG OK [APPENDUID 7 13] APPEND completed"});

    imap_session session(local_options(server.port()));
    session.login();
    command_result_t result = session.append("Sent Items", "(\\Seen)", "17-Jul-1996 02:44:25 -0700", RAW);
    BOOST_CHECK(result.ok());

    const vector<string>& received = server.received();
    BOOST_CHECK_EQUAL(server.error(), "");
    BOOST_REQUIRE_EQUAL(received.size(), 2u);
    BOOST_CHECK_EQUAL(received[1], "2 APPEND \"Sent Items\" (\\Seen) \"17-Jul-1996 02:44:25 -0700\" {" + to_string(RAW.size()) + "}");
    BOOST_CHECK_EQUAL(server.literal(), RAW);
}


BOOST_AUTO_TEST_CASE(mailbox_over_session)
{
    const string fetch_reply = "* 1 FETCH (UID 5 RFC822 {" + to_string(RAW.size()) + "}\r\n" + RAW + ")\r\n$TAG OK FETCH completed";
    scripted_server server({
        "$TAG OK LOGIN completed",
        "$TAG NO [NONEXISTENT] Mailbox does not exist",
        "$TAG OK CREATE completed",
        "$TAG OK SELECT completed",
        "* SEARCH 5\r\n$TAG OK SEARCH completed",
        fetch_reply,
        "$TAG OK FETCH completed",
        "* 1 FETCH (UID 5 FLAGS (\\Seen))\r\n$TAG OK FETCH completed",
        "* 1 FETCH (UID 5 INTERNALDATE \"17-Jul-1996 02:44:25 -0700\")\r\n$TAG OK FETCH completed",
        "* 1 FETCH (UID 5 RFC822.SIZE " + to_string(RAW.size()) + ")\r\n$TAG OK FETCH completed"});

    auto session = std::make_shared<imap_session>(local_options(server.port()));
    session->login();
    mailbox box(session, "Archive");
    BOOST_CHECK(box.keys() == (vector<unsigned long>{5}));
    BOOST_CHECK_EQUAL(box.get_raw_string(5), RAW);
    BOOST_CHECK_THROW(box.get(6), uidbox::no_such_message_error);

    uidbox::message_view view = box.get(5);
    BOOST_CHECK_EQUAL(view.content.subject(), "wire");
    BOOST_CHECK(view.flags.count(uidbox::FLAG_SEEN) > 0);
    BOOST_CHECK_EQUAL(view.size, RAW.size());
    BOOST_CHECK_EQUAL(view.internal_date_string(), "17-Jul-1996 09:44:25 +0000");

    BOOST_CHECK_EQUAL(server.received().size(), 10u);
    BOOST_CHECK_EQUAL(server.error(), "");
}
