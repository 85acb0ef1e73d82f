/*
  Ryufish, a USI shogi search core derived from Stockfish
  Copyright (C) 2004-2025 The Stockfish developers (see AUTHORS file)

  Ryufish is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Ryufish is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "ucioption.h"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

namespace Ryufish {

namespace {

bool is_integer(const std::string& s) {

    if (s.empty())
        return false;

    size_t i = s[0] == '-' || s[0] == '+';

    // Spin values fit in an int
    return i < s.size() && s.size() - i <= 9
        && std::all_of(s.begin() + i, s.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

}  // namespace


void OptionsMap::add_info_listener(InfoListener&& message_func) { info = std::move(message_func); }


bool OptionsMap::set(const std::string& name, const std::string& value) {

    if (!options_map.count(name))
    {
        sync_cout << "info string No such option: " << name << sync_endl;
        return false;
    }

    if (!options_map[name].assign(value))
    {
        sync_cout << "info string Invalid value for option " << name << ": " << value
                  << sync_endl;
        return false;
    }

    return true;
}


const Option& OptionsMap::operator[](const std::string& name) const {
    auto it = options_map.find(name);
    assert(it != options_map.end());
    return it->second;
}


// Inits options and assigns idx in the correct printing order
void OptionsMap::add(const std::string& name, const Option& option) {

    if (!options_map.count(name))
    {
        const size_t insert_order = options_map.size();

        options_map[name] = option;

        options_map[name].parent = this;
        options_map[name].idx    = insert_order;
    }
    else
    {
        std::cerr << "Option \"" << name << "\" was already added!" << std::endl;
        std::exit(EXIT_FAILURE);
    }
}


std::size_t OptionsMap::count(const std::string& name) const { return options_map.count(name); }


Option::Option(const char* v, OnChange f) :
    type("string"),
    min(0),
    max(0),
    on_change(std::move(f)) {
    defaultValue = currentValue = v;
}

Option::Option(bool v, OnChange f) :
    type("check"),
    min(0),
    max(0),
    on_change(std::move(f)) {
    defaultValue = currentValue = (v ? "true" : "false");
}

Option::Option(OnChange f) :
    type("button"),
    min(0),
    max(0),
    on_change(std::move(f)) {}

Option::Option(int v, int minv, int maxv, OnChange f) :
    type("spin"),
    min(minv),
    max(maxv),
    on_change(std::move(f)) {
    defaultValue = currentValue = std::to_string(v);
}


Option::operator int() const {
    assert(type == "check" || type == "spin");
    return (type == "spin" ? std::stoi(currentValue) : currentValue == "true");
}

Option::operator std::string() const {
    assert(type == "string");
    return currentValue;
}

bool Option::operator==(const char* s) const {
    assert(type == "combo" || type == "string");
    return !CaseInsensitiveLess()(currentValue, s) && !CaseInsensitiveLess()(s, currentValue);
}

bool Option::operator!=(const char* s) const { return !(*this == s); }


// Updates currentValue and triggers on_change() action. It's up to
// the GUI to check for option's limits, but we could receive the new value
// from the user by console window, so let's check the bounds anyway.
bool Option::assign(const std::string& v) {

    assert(!type.empty());

    if ((type != "button" && type != "string" && v.empty())
        || (type == "check" && v != "true" && v != "false")
        || (type == "spin" && (!is_integer(v) || std::stol(v) < min || std::stol(v) > max)))
        return false;

    if (type != "button")
        currentValue = v;

    if (on_change)
    {
        const auto ret = on_change(*this);

        if (ret && parent != nullptr && parent->info != nullptr)
            parent->info(ret);
    }

    return true;
}


std::ostream& operator<<(std::ostream& os, const OptionsMap& om) {

    for (size_t idx = 0; idx < om.options_map.size(); ++idx)
        for (const auto& it : om.options_map)
            if (it.second.idx == idx)
            {
                const Option& o = it.second;
                os << "\noption name " << it.first << " type " << o.type;

                if (o.type == "check" || o.type == "string")
                    os << " default " << (o.type == "string" && o.defaultValue.empty()
                                            ? "<empty>"
                                            : o.defaultValue);

                if (o.type == "spin")
                    os << " default " << o.defaultValue << " min " << o.min << " max " << o.max;

                break;
            }

    return os;
}

}  // namespace Ryufish
