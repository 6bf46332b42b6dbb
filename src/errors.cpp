/*

errors.cpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <uidbox/errors.hpp>


using std::string;


namespace uidbox
{


mailbox_error::mailbox_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


mailbox_error::mailbox_error(const char* msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string mailbox_error::details() const
{
    return details_;
}


flag_error::flag_error(const string& msg, const string& details, const string& flag) : protocol_error(msg, details), flag_(flag)
{
}


const string& flag_error::flag() const
{
    return flag_;
}


} // namespace uidbox
