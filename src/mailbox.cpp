/*

mailbox.cpp
-----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <uidbox/errors.hpp>
#include <uidbox/log.hpp>
#include <uidbox/mailbox.hpp>


using std::istringstream;
using std::make_pair;
using std::optional;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::vector;


namespace uidbox
{


namespace
{


session_port& checked_session(const shared_ptr<session_port>& session)
{
    if (session == nullptr)
        throw mailbox_error("Session expected.", "");
    return *session;
}


} // anonymous namespace


mailbox::snapshot::const_iterator::const_iterator(mailbox* box, const vector<unsigned long>* uids, std::size_t index) :
    box_(box), uids_(uids), index_(index)
{
}


mailbox::item_t mailbox::snapshot::const_iterator::operator*() const
{
    unsigned long uid = uids_->at(index_);
    return make_pair(uid, box_->get(uid));
}


mailbox::snapshot::const_iterator& mailbox::snapshot::const_iterator::operator++()
{
    ++index_;
    return *this;
}


mailbox::snapshot::const_iterator mailbox::snapshot::const_iterator::operator++(int)
{
    const_iterator previous = *this;
    ++index_;
    return previous;
}


bool mailbox::snapshot::const_iterator::operator==(const const_iterator& other) const
{
    return uids_ == other.uids_ && index_ == other.index_;
}


bool mailbox::snapshot::const_iterator::operator!=(const const_iterator& other) const
{
    return !(*this == other);
}


mailbox::snapshot::snapshot(mailbox& box, vector<unsigned long> uids) : box_(&box), uids_(std::move(uids))
{
}


mailbox::snapshot::const_iterator mailbox::snapshot::begin() const
{
    return const_iterator(box_, &uids_, 0);
}


mailbox::snapshot::const_iterator mailbox::snapshot::end() const
{
    return const_iterator(box_, &uids_, uids_.size());
}


const vector<unsigned long>& mailbox::snapshot::uids() const
{
    return uids_;
}


std::size_t mailbox::snapshot::size() const
{
    return uids_.size();
}


mailbox::value_snapshot::const_iterator::const_iterator(snapshot::const_iterator position) : position_(position)
{
}


message_view mailbox::value_snapshot::const_iterator::operator*() const
{
    return (*position_).second;
}


mailbox::value_snapshot::const_iterator& mailbox::value_snapshot::const_iterator::operator++()
{
    ++position_;
    return *this;
}


mailbox::value_snapshot::const_iterator mailbox::value_snapshot::const_iterator::operator++(int)
{
    const_iterator previous = *this;
    ++position_;
    return previous;
}


bool mailbox::value_snapshot::const_iterator::operator==(const const_iterator& other) const
{
    return position_ == other.position_;
}


bool mailbox::value_snapshot::const_iterator::operator!=(const const_iterator& other) const
{
    return !(*this == other);
}


mailbox::value_snapshot::value_snapshot(snapshot items) : items_(std::move(items))
{
}


mailbox::value_snapshot::const_iterator mailbox::value_snapshot::begin() const
{
    return const_iterator(items_.begin());
}


mailbox::value_snapshot::const_iterator mailbox::value_snapshot::end() const
{
    return const_iterator(items_.end());
}


std::size_t mailbox::value_snapshot::size() const
{
    return items_.size();
}


mailbox::mailbox(shared_ptr<session_port> session, const string& name, bool create, message_factory_t factory) :
    session_(std::move(session)), name_(name), create_(create), cache_(checked_session(session_)), searcher_(*session_), flags_(*session_),
    retriever_(*session_, cache_, flags_, std::move(factory)), transfer_(*session_, name_, searcher_, flags_, retriever_)
{
    select_folder(name_, create_);
}


bool mailbox::contains(unsigned long uid)
{
    ensure_selected();
    vector<unsigned long> uids = searcher_.search("ALL");
    return std::find(uids.begin(), uids.end(), uid) != uids.end();
}


std::size_t mailbox::size()
{
    ensure_selected();
    return searcher_.search("ALL").size();
}


message_view mailbox::get(unsigned long uid)
{
    ensure_selected();
    return retriever_.get_full(uid);
}


message_view mailbox::get(unsigned long uid, const message_view& default_value)
{
    ensure_selected();
    try
    {
        return retriever_.get_full(uid);
    }
    catch (const no_such_message_error&)
    {
        return default_value;
    }
}


string mailbox::get_raw_string(unsigned long uid)
{
    ensure_selected();
    return cache_.fetch(uid);
}


istringstream mailbox::get_raw_stream(unsigned long uid)
{
    ensure_selected();
    return istringstream(cache_.fetch(uid));
}


message_view mailbox::get_header(unsigned long uid)
{
    ensure_selected();
    return retriever_.get_header_only(uid);
}


vector<unsigned long> mailbox::keys()
{
    ensure_selected();
    return searcher_.search("ALL");
}


vector<message_view> mailbox::values()
{
    vector<message_view> views;
    for (auto uid : keys())
        views.push_back(get(uid));
    return views;
}


vector<mailbox::item_t> mailbox::items()
{
    vector<item_t> all;
    for (auto uid : keys())
        all.emplace_back(uid, get(uid));
    return all;
}


mailbox::snapshot mailbox::iterate()
{
    return snapshot(*this, keys());
}


vector<unsigned long> mailbox::iterate_keys()
{
    return keys();
}


mailbox::value_snapshot mailbox::iterate_values()
{
    return value_snapshot(iterate());
}


void mailbox::erase(unsigned long uid)
{
    ensure_selected();
    transfer_.remove(uid);
}


void mailbox::set(unsigned long uid, const message_view&)
{
    throw unsupported_operation_error("Replacing message not supported.", "UID=" + to_string(uid) + ".");
}


void mailbox::update(const vector<item_t>&)
{
    throw unsupported_operation_error("Replacing messages not supported.", "Folder=`" + name_ + "`.");
}


unsigned long mailbox::add(const message_view& msg)
{
    flag_set_t flags = msg.flags;
    // A view fetched from a server may carry the recent flag, which servers refuse on append.
    flags.erase(FLAG_RECENT);
    command_result_t result = session_->append(name_, format_flag_list(flags), msg.internal_date_string(), msg.content.format());
    if (!result.ok())
        throw protocol_error("Appending message failure.", "Folder=`" + name_ + "`, response=`" + result.response + "`.");
    flush();

    vector<unsigned long> uids = searcher_.all_undeleted();
    if (uids.empty())
        throw no_such_message_error("Appended message not found.", "Folder=`" + name_ + "`.");
    return *std::max_element(uids.begin(), uids.end());
}


unsigned long mailbox::add(const message& msg)
{
    return add(message_view(msg));
}


message_view mailbox::pop(unsigned long uid)
{
    message_view msg = get(uid);
    erase(uid);
    flush();
    return msg;
}


message_view mailbox::pop(unsigned long uid, const message_view& default_value)
{
    try
    {
        return pop(uid);
    }
    catch (const no_such_message_error&)
    {
        return default_value;
    }
}


mailbox::item_t mailbox::pop_item()
{
    flush();
    vector<unsigned long> uids = searcher_.search("ALL");
    if (uids.empty())
        throw empty_mailbox_error("Mailbox is empty.", "Folder=`" + name_ + "`.");
    unsigned long uid = uids.front();
    return make_pair(uid, pop(uid));
}


void mailbox::clear()
{
    ensure_selected();
    transfer_.clear();
}


void mailbox::switch_folder(const string& name, bool create)
{
    flush();
    select_folder(name, create);
    logger()->debug("Switched from `{}` to `{}`.", name_, name);
    name_ = name;
    transfer_.folder(name_);
    cache_.invalidate();
}


void mailbox::close()
{
    flush();
    session_->close();
    session_->logout();
}


void mailbox::reconnect()
{
    session_->reconnect();
    session_->login();
    cache_.invalidate();
    select_folder(name_, create_);
    logger()->info("Reconnected to `{}`.", name_);
}


void mailbox::flush()
{
    expunge();
}


void mailbox::lock()
{
}


void mailbox::unlock()
{
}


optional<string> mailbox::folder_on(const session_port& session) const
{
    if (&session == session_.get())
        return name_;
    return std::nullopt;
}


void mailbox::trash(const target_t& target)
{
    transfer_.trash(target);
}


vector<unsigned long> mailbox::search(const string& criteria)
{
    ensure_selected();
    return searcher_.search(criteria);
}


vector<unsigned long> mailbox::unseen_uids()
{
    ensure_selected();
    return searcher_.unseen_undeleted();
}


vector<unsigned long> mailbox::all_uids()
{
    ensure_selected();
    return searcher_.all_undeleted();
}


void mailbox::copy(unsigned long uid, const target_t& target)
{
    ensure_selected();
    transfer_.copy(uid, target);
}


void mailbox::move(unsigned long uid, const target_t& target)
{
    ensure_selected();
    transfer_.move(uid, target);
}


void mailbox::discard(unsigned long uid)
{
    ensure_selected();
    transfer_.discard(uid);
}


void mailbox::remove(unsigned long uid)
{
    ensure_selected();
    transfer_.remove(uid);
}


void mailbox::expunge()
{
    ensure_selected();
    transfer_.expunge();
    // The cached message may be among the expunged ones.
    cache_.invalidate();
}


flag_controller& mailbox::flags()
{
    ensure_selected();
    return flags_;
}


const string& mailbox::name() const
{
    return name_;
}


shared_ptr<session_port> mailbox::session() const
{
    return session_;
}


bool mailbox::operator==(const mailbox& other) const
{
    return session_ == other.session_ && name_ == other.name_;
}


bool mailbox::operator!=(const mailbox& other) const
{
    return !(*this == other);
}


void mailbox::ensure_selected()
{
    if (session_->selected() == name_)
        return;
    logger()->debug("Selecting `{}` again, the session has `{}` selected.", name_, session_->selected());
    session_->select(name_);
}


void mailbox::select_folder(const string& name, bool create)
{
    try
    {
        session_->select(name);
    }
    catch (const no_such_folder_error&)
    {
        if (!create)
            throw;
        logger()->info("Creating folder `{}`.", name);
        session_->create(name);
        session_->select(name);
    }
}


} // namespace uidbox
