/*

session_port.cpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <uidbox/session_port.hpp>


using std::string;


namespace uidbox
{


string to_astring(const string& text)
{
    string quoted{"\""};
    for (auto ch : text)
    {
        if (ch == '"' || ch == '\\')
            quoted += '\\';
        quoted += ch;
    }
    quoted += "\"";
    return quoted;
}


} // namespace uidbox
