/*

mailbox.hpp
-----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "flag_controller.hpp"
#include "mailbox_sink.hpp"
#include "message.hpp"
#include "message_cache.hpp"
#include "retriever.hpp"
#include "searcher.hpp"
#include "session_port.hpp"
#include "transfer.hpp"
#include "export.hpp"


namespace uidbox
{


/**
Folder of a server presented as a collection of messages keyed by their UIDs.

Every operation goes to the server, the only state kept locally is the last fully fetched message. Several mailboxes may share a session,
each one selects its folder again before a command if the session has another folder selected. A mailbox is not thread safe.
**/
class UIDBOX_EXPORT mailbox : public mailbox_sink
{
public:

    /**
    Message paired with its UID.
    **/
    using item_t = std::pair<unsigned long, message_view>;

    /**
    UIDs taken at one moment, each resolved to its message only when reached.

    Changes on the server after the snapshot are not reflected; a message removed meanwhile makes the dereference throw
    `no_such_message_error`. Taking a new snapshot restarts the iteration.
    **/
    class UIDBOX_EXPORT snapshot
    {
    public:

        class UIDBOX_EXPORT const_iterator
        {
        public:

            using iterator_category = std::input_iterator_tag;
            using value_type = item_t;
            using difference_type = std::ptrdiff_t;
            using pointer = const item_t*;
            using reference = item_t;

            const_iterator(mailbox* box, const std::vector<unsigned long>* uids, std::size_t index);

            /**
            Retrieving the message at the current position.

            @throw * `mailbox::get(unsigned long)`.
            **/
            item_t operator*() const;

            const_iterator& operator++();

            const_iterator operator++(int);

            bool operator==(const const_iterator& other) const;

            bool operator!=(const const_iterator& other) const;

        private:

            mailbox* box_;

            const std::vector<unsigned long>* uids_;

            std::size_t index_;
        };

        snapshot(mailbox& box, std::vector<unsigned long> uids);

        const_iterator begin() const;

        const_iterator end() const;

        const std::vector<unsigned long>& uids() const;

        std::size_t size() const;

    private:

        mailbox* box_;

        std::vector<unsigned long> uids_;
    };

    /**
    Messages of a snapshot without their UIDs, each retrieved only when reached.
    **/
    class UIDBOX_EXPORT value_snapshot
    {
    public:

        class UIDBOX_EXPORT const_iterator
        {
        public:

            using iterator_category = std::input_iterator_tag;
            using value_type = message_view;
            using difference_type = std::ptrdiff_t;
            using pointer = const message_view*;
            using reference = message_view;

            explicit const_iterator(snapshot::const_iterator position);

            /**
            @throw * `mailbox::get(unsigned long)`.
            **/
            message_view operator*() const;

            const_iterator& operator++();

            const_iterator operator++(int);

            bool operator==(const const_iterator& other) const;

            bool operator!=(const const_iterator& other) const;

        private:

            snapshot::const_iterator position_;
        };

        explicit value_snapshot(snapshot items);

        const_iterator begin() const;

        const_iterator end() const;

        std::size_t size() const;

    private:

        snapshot items_;
    };

    /**
    Selecting the folder, creating it first if it does not exist and creating is allowed.

    @param session Session logged in to the server.
    @param name    Folder name.
    @param create  Flag whether a missing folder is created.
    @param factory Transformation of the retrieved messages, none if empty.
    @throw no_such_folder_error Folder does not exist and creating is not allowed.
    @throw *                    `session_port::select(const std::string&)`, `session_port::create(const std::string&)`.
    **/
    mailbox(std::shared_ptr<session_port> session, const std::string& name, bool create = true, message_factory_t factory = nullptr);

    mailbox(const mailbox&) = delete;

    mailbox(mailbox&&) = delete;

    ~mailbox() override = default;

    void operator=(const mailbox&) = delete;

    void operator=(mailbox&&) = delete;

    /**
    Checking whether a message exists, by searching all messages.

    @param uid Message to check.
    @return    True if the message exists.
    @throw * `searcher::search(const std::string&)`.
    **/
    bool contains(unsigned long uid);

    /**
    Counting the messages, by searching all messages.

    @return Number of messages.
    @throw * `searcher::search(const std::string&)`.
    **/
    std::size_t size();

    /**
    Retrieving a message.

    @param uid Message to retrieve.
    @return    Message view.
    @throw no_such_message_error Message does not exist.
    @throw *                     `retriever::get_full(unsigned long)`.
    **/
    message_view get(unsigned long uid);

    /**
    Retrieving a message, or the default value if it does not exist.

    @param uid           Message to retrieve.
    @param default_value Value returned for the missing message.
    @return              Message view or the default value.
    @throw * `retriever::get_full(unsigned long)`, except `no_such_message_error`.
    **/
    message_view get(unsigned long uid, const message_view& default_value);

    /**
    Getting the raw message as fetched from the server.

    @param uid Message to fetch.
    @return    Message in its wire format.
    @throw * `message_cache::fetch(unsigned long)`.
    **/
    std::string get_raw_string(unsigned long uid);

    /**
    Getting the raw message as a stream.

    @param uid Message to fetch.
    @return    Stream over the message in its wire format.
    @throw * `message_cache::fetch(unsigned long)`.
    **/
    std::istringstream get_raw_stream(unsigned long uid);

    /**
    Retrieving the message header only.

    @param uid Message to retrieve.
    @return    Message view without the body.
    @throw * `retriever::get_header_only(unsigned long)`.
    **/
    message_view get_header(unsigned long uid);

    /**
    Getting the UIDs of all messages at the time of the call.

    @return UIDs in the server order.
    @throw * `searcher::search(const std::string&)`.
    **/
    std::vector<unsigned long> keys();

    std::vector<message_view> values();

    std::vector<item_t> items();

    /**
    Taking the snapshot of all messages for the lazy iteration.

    @return Snapshot to iterate over.
    @throw * `searcher::search(const std::string&)`.
    **/
    snapshot iterate();

    /**
    Taking the snapshot of the UIDs for the iteration over the keys. The UIDs need no further request, so it equals `keys()`.

    @return UIDs in the server order.
    @throw * `searcher::search(const std::string&)`.
    **/
    std::vector<unsigned long> iterate_keys();

    /**
    Taking the snapshot of all messages for the lazy iteration over the messages only.

    @return Snapshot to iterate over.
    @throw * `searcher::search(const std::string&)`.
    **/
    value_snapshot iterate_values();

    /**
    Removing a message; it stays flagged as deleted until the flush.

    @param uid Message to remove.
    @throw * `transfer::remove(unsigned long)`.
    **/
    void erase(unsigned long uid);

    /**
    Replacing a message is not supported by the protocol.

    @throw unsupported_operation_error Always.
    **/
    void set(unsigned long uid, const message_view& msg);

    /**
    Replacing messages is not supported by the protocol.

    @throw unsupported_operation_error Always.
    **/
    void update(const std::vector<item_t>& items);

    /**
    Appending a message with its flags and internal date, then flushing.

    The returned UID is the highest one after the append. It is the appended message unless another client appended concurrently.

    @param msg Message to append.
    @return    Highest UID of the folder.
    @throw protocol_error        Append status is not OK.
    @throw no_such_message_error Folder is empty after the append.
    @throw *                     `flush()`, `searcher::search(const std::string&)`.
    **/
    unsigned long add(const message_view& msg) override;

    /**
    Appending a message without flags, letting the server assign the internal date.

    @param msg Message to append.
    @return    Highest UID of the folder.
    @throw * `add(const message_view&)`.
    **/
    unsigned long add(const message& msg);

    /**
    Retrieving a message, then removing it and flushing.

    @param uid Message to pop.
    @return    Message view.
    @throw no_such_message_error Message does not exist.
    @throw *                     `get(unsigned long)`, `erase(unsigned long)`, `flush()`.
    **/
    message_view pop(unsigned long uid);

    /**
    Popping a message, or returning the default value if it does not exist.

    @param uid           Message to pop.
    @param default_value Value returned for the missing message.
    @return              Message view or the default value.
    **/
    message_view pop(unsigned long uid, const message_view& default_value);

    /**
    Popping the first message of the folder.

    @return UID and message.
    @throw empty_mailbox_error Folder has no messages.
    @throw *                   `pop(unsigned long)`.
    **/
    item_t pop_item();

    /**
    Discarding all messages, then flushing.

    @throw * `transfer::clear()`.
    **/
    void clear();

    /**
    Flushing the current folder and selecting another one.

    @param name   Folder to switch to.
    @param create Flag whether a missing folder is created.
    @throw no_such_folder_error Folder does not exist and creating is not allowed.
    @throw *                    `flush()`, `session_port::select(const std::string&)`, `session_port::create(const std::string&)`.
    **/
    void switch_folder(const std::string& name, bool create = true);

    /**
    Flushing, closing the folder and logging out.

    @throw * `flush()`, `session_port::close()`, `session_port::logout()`.
    **/
    void close();

    /**
    Reconnecting the session, logging in again and selecting the folder.

    @throw * `session_port::reconnect()`, `session_port::login()`, `session_port::select(const std::string&)`.
    **/
    void reconnect();

    /**
    Expunging the folder and dropping the cached message.

    @throw * `transfer::expunge()`.
    **/
    void flush() override;

    /**
    Servers do not offer folder locking, nothing is done.
    **/
    void lock() override;

    /**
    Servers do not offer folder locking, nothing is done.
    **/
    void unlock() override;

    std::optional<std::string> folder_on(const session_port& session) const override;

    /**
    Setting the folder receiving the discarded messages.

    @param target Folder name or sink, `std::monostate` to discard in place.
    **/
    void trash(const target_t& target);

    /**
    Searching the messages by the given criteria.

    @param criteria Search criteria.
    @return         UIDs found.
    @throw * `searcher::search(const std::string&)`.
    **/
    std::vector<unsigned long> search(const std::string& criteria = "ALL");

    std::vector<unsigned long> unseen_uids();

    std::vector<unsigned long> all_uids();

    /**
    @throw * `transfer::copy(unsigned long, const target_t&)`.
    **/
    void copy(unsigned long uid, const target_t& target);

    /**
    @throw * `transfer::move(unsigned long, const target_t&)`.
    **/
    void move(unsigned long uid, const target_t& target);

    /**
    @throw * `transfer::discard(unsigned long)`.
    **/
    void discard(unsigned long uid);

    /**
    @throw * `transfer::remove(unsigned long)`.
    **/
    void remove(unsigned long uid);

    /**
    Permanently removing the messages flagged as deleted and dropping the cached message.

    @throw * `transfer::expunge()`.
    **/
    void expunge();

    /**
    Selecting the folder if needed and getting its flag controller.

    The controller issues its commands against whatever folder the session has selected, so another mailbox on the same session must not
    be used while the controller is in use.

    @return Flag controller.
    @throw * `session_port::select(const std::string&)`.
    **/
    flag_controller& flags();

    const std::string& name() const;

    std::shared_ptr<session_port> session() const;

    /**
    Mailboxes are equal if they share the session and the folder name.
    **/
    bool operator==(const mailbox& other) const;

    bool operator!=(const mailbox& other) const;

private:

    /**
    Selecting the folder of this mailbox unless it is already the selected one.

    @throw no_such_folder_error The folder was deleted meanwhile.
    **/
    void ensure_selected();

    /**
    Selecting a folder, creating it if missing and allowed.
    **/
    void select_folder(const std::string& name, bool create);

    std::shared_ptr<session_port> session_;

    std::string name_;

    bool create_;

    message_cache cache_;

    searcher searcher_;

    flag_controller flags_;

    retriever retriever_;

    transfer transfer_;
};


} // namespace uidbox


#ifdef _MSC_VER
#pragma warning(pop)
#endif
