/*

transfer.cpp
------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <uidbox/errors.hpp>
#include <uidbox/log.hpp>
#include <uidbox/transfer.hpp>


using std::get_if;
using std::holds_alternative;
using std::string;
using std::to_string;
using std::vector;


namespace uidbox
{


transfer::transfer(session_port& session, const string& folder_name, searcher& search, flag_controller& flags, retriever& retrieve) :
    session_(session), folder_name_(folder_name), searcher_(search), flags_(flags), retriever_(retrieve)
{
}


transfer::resolved_target_t transfer::resolve(const target_t& target) const
{
    if (const string* name = get_if<string>(&target))
        return same_server_folder{*name};

    if (mailbox_sink* const* sink = get_if<mailbox_sink*>(&target))
    {
        if (*sink == nullptr)
            return invalid_target{};
        std::optional<string> folder = (*sink)->folder_on(session_);
        if (folder.has_value())
            return same_server_folder{folder.value()};
        return foreign_sink{*sink};
    }

    return invalid_target{};
}


void transfer::copy(unsigned long uid, const target_t& target)
{
    copy_resolved(uid, resolve(target));
}


void transfer::move(unsigned long uid, const target_t& target)
{
    resolved_target_t resolved = resolve(target);
    copy_resolved(uid, resolved);
    if (!is_source(resolved))
        flags_.add_flags(uid, {FLAG_DELETED});
}


void transfer::discard(unsigned long uid)
{
    if (holds_alternative<std::monostate>(trash_))
    {
        flags_.add_flags(uid, {FLAG_DELETED});
        return;
    }

    if (const string* name = get_if<string>(&trash_))
        logger()->info("Moving message {} from `{}` to the trash `{}`.", uid, folder_name_, *name);
    else
        logger()->info("Moving message {} from `{}` to the trash.", uid, folder_name_);
    move(uid, trash_);
}


void transfer::remove(unsigned long uid)
{
    vector<unsigned long> uids = searcher_.search("ALL");
    if (std::find(uids.begin(), uids.end(), uid) == uids.end())
        throw no_such_message_error("No such message.", "UID=" + to_string(uid) + ", folder=`" + folder_name_ + "`.");
    discard(uid);
}


void transfer::expunge()
{
    command_result_t result = session_.expunge();
    if (!result.ok())
        throw protocol_error("Expunge failure.", "Folder=`" + folder_name_ + "`, response=`" + result.response + "`.");
}


void transfer::clear()
{
    for (auto uid : searcher_.all_undeleted())
        discard(uid);
    expunge();
}


void transfer::trash(const target_t& target)
{
    trash_ = target;
}


const target_t& transfer::trash() const
{
    return trash_;
}


void transfer::folder(const string& folder_name)
{
    folder_name_ = folder_name;
}


void transfer::copy_resolved(unsigned long uid, const resolved_target_t& target)
{
    if (holds_alternative<invalid_target>(target))
        throw unsupported_target_error("Unsupported copy target.", "UID=" + to_string(uid) + ".");

    if (const same_server_folder* folder = get_if<same_server_folder>(&target))
    {
        if (folder->name == folder_name_)
            return;

        // The server copies a missing message silently.
        if (searcher_.search("UID " + to_string(uid)).empty())
            throw no_such_message_error("No such message.", "UID=" + to_string(uid) + ", folder=`" + folder_name_ + "`.");
        command_result_t result = session_.uid_command("COPY", {to_string(uid), to_astring(folder->name)});
        if (!result.ok())
            throw protocol_error("Copying message failure.", "UID=" + to_string(uid) + ", target=`" + folder->name + "`, response=`" +
                result.response + "`.");
        logger()->debug("Message {} copied from `{}` to `{}`.", uid, folder_name_, folder->name);
        return;
    }

    mailbox_sink* sink = std::get<foreign_sink>(target).sink;
    message_view msg = retriever_.get_full(uid);
    sink->lock();
    try
    {
        sink->add(msg);
        sink->flush();
    }
    catch (...)
    {
        sink->unlock();
        throw;
    }
    sink->unlock();
    logger()->debug("Message {} copied from `{}` to a foreign sink.", uid, folder_name_);
}


bool transfer::is_source(const resolved_target_t& target) const
{
    const same_server_folder* folder = get_if<same_server_folder>(&target);
    return folder != nullptr && folder->name == folder_name_;
}


} // namespace uidbox
