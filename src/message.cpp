/*

message.cpp
-----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <array>
#include <locale>
#include <sstream>
#include <string>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <uidbox/errors.hpp>
#include <uidbox/message.hpp>


using std::array;
using std::stoi;
using std::string;
using std::stringstream;
using std::vector;
using boost::iequals;
using boost::regex;
using boost::regex_match;
using boost::smatch;
using boost::algorithm::join;
using boost::algorithm::trim_copy;
using boost::algorithm::trim_right_if;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using boost::posix_time::hours;
using boost::posix_time::minutes;


namespace uidbox
{


const string FLAG_SEEN{"\\Seen"};
const string FLAG_ANSWERED{"\\Answered"};
const string FLAG_FLAGGED{"\\Flagged"};
const string FLAG_DELETED{"\\Deleted"};
const string FLAG_DRAFT{"\\Draft"};
const string FLAG_RECENT{"\\Recent"};


string format_flag_list(const flag_set_t& flags)
{
    return "(" + join(flags, " ") + ")";
}


message::message(const string& raw)
{
    parse(raw);
}


void message::parse(const string& raw)
{
    headers_.clear();
    body_.clear();

    string::size_type pos = 0;
    while (pos < raw.size())
    {
        string::size_type eol = raw.find('\n', pos);
        string line = raw.substr(pos, eol == string::npos ? string::npos : eol - pos);
        pos = (eol == string::npos) ? raw.size() : eol + 1;
        trim_right_if(line, [](char c) { return c == '\r'; });

        if (line.empty())
        {
            body_ = raw.substr(pos);
            return;
        }

        // Folded line continues the previous header.
        if ((line[0] == ' ' || line[0] == '\t') && !headers_.empty())
        {
            headers_.back().second += " " + trim_copy(line);
            continue;
        }

        // A field name is nonempty and has no whitespace, anything else is kept as it is.
        string::size_type colon = line.find(':');
        string name = colon == string::npos ? string() : trim_copy(line.substr(0, colon));
        if (name.empty() || name.find_first_of(" \t") != string::npos)
            headers_.emplace_back(string(), line);
        else
            headers_.emplace_back(name, trim_copy(line.substr(colon + 1)));
    }
}


string message::format() const
{
    string formatted;
    for (const auto& h : headers_)
        formatted += (h.first.empty() ? h.second : h.first + ": " + h.second) + "\r\n";
    formatted += "\r\n";
    formatted += body_;
    return formatted;
}


string message::header(const string& name) const
{
    if (name.empty())
        return string();
    auto it = std::find_if(headers_.begin(), headers_.end(), [&name](const header_t& h) { return iequals(h.first, name); });
    return it == headers_.end() ? string() : it->second;
}


bool message::has_header(const string& name) const
{
    return !name.empty() && std::any_of(headers_.begin(), headers_.end(), [&name](const header_t& h) { return iequals(h.first, name); });
}


void message::add_header(const string& name, const string& value)
{
    headers_.emplace_back(name, value);
}


void message::remove_header(const string& name)
{
    if (name.empty())
        return;
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(), [&name](const header_t& h) { return iequals(h.first, name); }),
        headers_.end());
}


const vector<message::header_t>& message::headers() const
{
    return headers_;
}


const string& message::body() const
{
    return body_;
}


void message::body(const string& content)
{
    body_ = content;
}


string message::subject() const
{
    return header("Subject");
}


string message::from() const
{
    return header("From");
}


message_view::message_view(const message& msg) : content(msg)
{
}


string message_view::flag_string() const
{
    return format_flag_list(flags);
}


string message_view::internal_date_string() const
{
    return internal_date.has_value() ? format_internal_date(internal_date.value()) : string();
}


ptime parse_internal_date(const string& text)
{
    static const regex DATE_REGEX{R"(^\s*(\d{1,2})-([A-Za-z]{3})-(\d{4}) (\d{2}):(\d{2}):(\d{2}) ([+-])(\d{2})(\d{2})\s*$)"};
    static const array<const char*, 12> MONTHS{"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    smatch match;
    if (!regex_match(text, match, DATE_REGEX))
        throw malformed_response_error("Invalid internal date.", "Date=`" + text + "`.");

    auto month = std::find_if(MONTHS.begin(), MONTHS.end(), [&match](const char* m) { return iequals(m, match[2].str()); });
    if (month == MONTHS.end())
        throw malformed_response_error("Invalid internal date month.", "Date=`" + text + "`.");

    try
    {
        boost::gregorian::date day(static_cast<unsigned short>(stoi(match[3].str())), static_cast<unsigned short>(month - MONTHS.begin() + 1),
            static_cast<unsigned short>(stoi(match[1].str())));
        ptime local(day, time_duration(stoi(match[4].str()), stoi(match[5].str()), stoi(match[6].str())));
        time_duration offset = hours(stoi(match[8].str())) + minutes(stoi(match[9].str()));
        // Local time minus its offset east of UTC is UTC.
        return match[7].str() == "+" ? local - offset : local + offset;
    }
    catch (const std::out_of_range& exc)
    {
        throw malformed_response_error("Invalid internal date.", exc.what());
    }
}


string format_internal_date(const ptime& time)
{
    stringstream ss;
    ss.exceptions(std::ios_base::failbit);
    boost::posix_time::time_facet* facet = new boost::posix_time::time_facet("%d-%b-%Y %H:%M:%S +0000");
    ss.imbue(std::locale(std::locale::classic(), facet));
    ss << time;
    return ss.str();
}


} // namespace uidbox
