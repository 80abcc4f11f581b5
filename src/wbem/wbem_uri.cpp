/*  $Id$
 * ===========================================================================
 *
 *                            PUBLIC DOMAIN NOTICE
 *               National Center for Biotechnology Information
 *
 *  This software/database is a "United States Government Work" under the
 *  terms of the United States Copyright Act.  It was written as part of
 *  the author's official duties as a United States Government employee and
 *  thus cannot be copyrighted.  This software/database is freely available
 *  to the public for use. The National Library of Medicine and the U.S.
 *  Government have not placed any restriction on its use or reproduction.
 *
 *  Although all reasonable efforts have been taken to ensure the accuracy
 *  and reliability of the software and data, the NLM and the U.S.
 *  Government do not and cannot warrant the performance or results that
 *  may be obtained by using this software or data. The NLM and the U.S.
 *  Government disclaim all warranties, express or implied, including
 *  warranties of performance, merchantability or fitness for any particular
 *  purpose.
 *
 *  Please cite the author in any work or product based on this material.
 *
 * ===========================================================================
 *
 * Author:  WBEM library group
 *
 * File Description:
 *   WBEM URI (DSP0207) parsing and formatting
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/wbem_uri.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/error_codes.hpp>
#include <corelib/ncbi_limits.h>
#include <math.h>
#include <limits>
#include <algorithm>


#define NCBI_USE_ERRCODE_X   Wbem_Uri


BEGIN_WBEM_SCOPE


static const char* const kKnownSchemes[] = {
    "http",
    "https",
    "cimxml-wbem",
    "cimxml-wbems"
};


static bool s_IsNameChar(char c)
{
    // Non-ASCII bytes belong to UTF-8 encoded identifier characters
    return isalnum((unsigned char) c)  ||  c == '_'  ||
        (unsigned char) c >= 0x80;
}


static bool s_IsSchemeChar(char c)
{
    return isalnum((unsigned char) c)  ||  c == '-'  ||  c == '+'  ||
        c == '.';
}


static void s_CheckName(const string& name, const char* what,
                        const string& uri)
{
    if (name.empty()) {
        NCBI_THROW(CCimException, eValue,
                   string("Missing ") + what + " in WBEM URI: " + uri);
    }
    ITERATE(string, it, name) {
        if ( !s_IsNameChar(*it) ) {
            NCBI_THROW(CCimException, eValue,
                       string("Invalid character '") + *it + "' in " +
                       what + " '" + name + "' of WBEM URI: " + uri);
        }
    }
}


static void s_CheckNamespace(const string& name_space, const string& uri)
{
    list<string> parts;
    NStr::Split(name_space, "/", parts);
    ITERATE(list<string>, it, parts) {
        if (it->empty()) {
            NCBI_THROW(CCimException, eValue,
                       "Empty namespace component in WBEM URI: " + uri);
        }
        ITERATE(string, c, *it) {
            if ( !s_IsNameChar(*c)  &&  *c != '-'  &&  *c != '.' ) {
                NCBI_THROW(CCimException, eValue,
                           string("Invalid character '") + *c +
                           "' in namespace of WBEM URI: " + uri);
            }
        }
    }
}


// yyyymmddhhmmss.mmmmmm[+-:]uuu with ASCII digits
static bool s_LooksLikeDateTime(const string& text)
{
    if (text.size() != 25  ||  text[14] != '.') {
        return false;
    }
    char sep = text[21];
    if (sep != '+'  &&  sep != '-'  &&  sep != ':') {
        return false;
    }
    for (size_t i = 0;  i < text.size();  ++i) {
        if (i == 14  ||  i == 21) {
            continue;
        }
        if (text[i] < '0'  ||  text[i] > '9') {
            return false;
        }
    }
    return true;
}


// Position of the ':' closing a namespace that starts at 'pos', or NPOS.
// Namespaces may contain '.', class names and keybindings follow the ':'.
static SIZE_TYPE s_FindNamespaceEnd(const string& text, SIZE_TYPE pos)
{
    SIZE_TYPE colon = text.find(':', pos);
    if (colon == NPOS) {
        return NPOS;
    }
    for (SIZE_TYPE i = pos;  i < colon;  ++i) {
        char c = text[i];
        if ( !s_IsNameChar(c)  &&  c != '/'  &&  c != '-'  &&  c != '.' ) {
            return NPOS;
        }
    }
    return colon;
}


// [scheme://authority]/ns:Class. or ns:Class. followed by keybindings
static bool s_LooksLikeInstancePath(const string& text)
{
    SIZE_TYPE pos = 0;
    SIZE_TYPE auth = text.find("//");
    if (auth != NPOS) {
        for (SIZE_TYPE i = 0;  i < auth;  ++i) {
            if ( !s_IsSchemeChar(text[i])  &&  text[i] != ':' ) {
                return false;
            }
        }
        pos = text.find('/', auth + 2);
        if (pos == NPOS) {
            return false;
        }
    }
    SIZE_TYPE colon = s_FindNamespaceEnd(text, pos);
    if (colon == NPOS) {
        return false;
    }
    SIZE_TYPE dot = text.find('.', colon + 1);
    if (dot == NPOS  ||  dot == colon + 1) {
        return false;
    }
    for (SIZE_TYPE i = colon + 1;  i < dot;  ++i) {
        if ( !s_IsNameChar(text[i]) ) {
            return false;
        }
    }
    return dot + 1 == text.size()  ||  text.find('=', dot) != NPOS;
}


// Quoted string starting at 'pos'; backslash escapes the next character.
// 'first_escaped' reports an escape on the first character.
static string s_ParseQuoted(const string& text, SIZE_TYPE& pos,
                            const string& uri, bool* first_escaped = 0)
{
    char quote = text[pos];
    string ret;
    SIZE_TYPE i = pos + 1;
    if (first_escaped) {
        *first_escaped = i < text.size()  &&  text[i] == '\\';
    }
    for (;;) {
        if (i >= text.size()) {
            NCBI_THROW(CCimException, eValue,
                       "Unterminated quoted keybinding value in WBEM URI: " +
                       uri);
        }
        char c = text[i];
        if (c == '\\') {
            if (i + 1 >= text.size()) {
                NCBI_THROW(CCimException, eValue,
                           "Incomplete escape sequence in WBEM URI: " + uri);
            }
            ret += text[i + 1];
            i += 2;
        } else if (c == quote) {
            break;
        } else {
            ret += c;
            ++i;
        }
    }
    pos = i + 1;
    return ret;
}


static size_t s_CountCodePoints(const string& text)
{
    size_t count = 0;
    ITERATE(string, it, text) {
        if (((unsigned char) *it & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}


// Integer in decimal, 0x hex, 0 octal or b-suffixed binary notation.
// Return false if the token is not shaped like an integer.
static bool s_ParseInteger(const string& token, CCimValue& value,
                           const string& uri)
{
    SIZE_TYPE start = 0;
    bool negative = false;
    if (token[0] == '+'  ||  token[0] == '-') {
        negative = token[0] == '-';
        start = 1;
    }
    string digits = token.substr(start);
    if (digits.empty()) {
        return false;
    }
    int base = 10;
    char last = digits[digits.size() - 1];
    if (digits.size() > 2  &&  digits[0] == '0'  &&
        (digits[1] == 'x'  ||  digits[1] == 'X')) {
        base = 16;
        digits.erase(0, 2);
    } else if (digits.size() > 1  &&  (last == 'b'  ||  last == 'B')) {
        base = 2;
        digits.erase(digits.size() - 1);
    } else if (digits.size() > 1  &&  digits[0] == '0') {
        base = 8;
    }
    ITERATE(string, it, digits) {
        char c = *it;
        bool valid = base == 16 ? isxdigit((unsigned char) c) != 0
            : (c >= '0'  &&  c < '0' + base);
        if ( !valid ) {
            return false;
        }
    }

    Uint8 magnitude = 0;
    try {
        magnitude = NStr::StringToUInt8(digits, 0, base);
    }
    catch (CStringException& e) {
        NCBI_RETHROW(e, CCimException, eValue,
                     "Invalid integer keybinding value '" + token +
                     "' in WBEM URI: " + uri);
    }
    if (negative) {
        if (magnitude > Uint8(kMax_I8) + 1) {
            NCBI_THROW(CCimException, eValue,
                       "Integer keybinding value '" + token +
                       "' is too small in WBEM URI: " + uri);
        }
        value = magnitude == 0 ? CCimValue(Int8(0))
            : CCimValue(Int8(-Int8(magnitude - 1) - 1));
    } else if (magnitude <= Uint8(kMax_I8)) {
        value = CCimValue(Int8(magnitude));
    } else {
        value = CCimValue(magnitude);
    }
    return true;
}


static CCimValue s_ParseUnquoted(const string& token, const string& uri)
{
    if (token.empty()) {
        NCBI_THROW(CCimException, eValue,
                   "Missing keybinding value in WBEM URI: " + uri);
    }
    if (NStr::EqualNocase(token, "true")) {
        return CCimValue(true);
    }
    if (NStr::EqualNocase(token, "false")) {
        return CCimValue(false);
    }
    if (NStr::EqualNocase(token, "INF")) {
        return CCimValue(HUGE_VAL);
    }
    if (NStr::EqualNocase(token, "-INF")) {
        return CCimValue(-HUGE_VAL);
    }
    if (NStr::EqualNocase(token, "NAN")) {
        return CCimValue(numeric_limits<double>::quiet_NaN());
    }
    CCimValue value;
    if (s_ParseInteger(token, value, uri)) {
        return value;
    }
    if (s_LooksLikeDateTime(token)) {
        ERR_POST_X(2, Warning << "Unquoted datetime keybinding value "
                   << token << " in WBEM URI: " << uri);
        return CCimValue(CCimDateTime(token));
    }
    bool has_digit = false;
    ITERATE(string, it, token) {
        char c = *it;
        if (c >= '0'  &&  c <= '9') {
            has_digit = true;
        } else if (c != '+'  &&  c != '-'  &&  c != '.'  &&
                   c != 'e'  &&  c != 'E') {
            has_digit = false;
            break;
        }
    }
    if ( !has_digit ) {
        NCBI_THROW(CCimException, eValue,
                   "Invalid keybinding value '" + token +
                   "' in WBEM URI: " + uri);
    }
    try {
        return CCimValue(NStr::StringToDouble(token, NStr::fDecimalPosix));
    }
    catch (CStringException& e) {
        NCBI_RETHROW(e, CCimException, eValue,
                     "Invalid real keybinding value '" + token +
                     "' in WBEM URI: " + uri);
    }
}


// Value starting at 'pos'; 'pos' is moved past it
static CCimValue s_ParseKeyValue(const string& text, SIZE_TYPE& pos,
                                 const string& uri)
{
    if (pos >= text.size()) {
        NCBI_THROW(CCimException, eValue,
                   "Missing keybinding value in WBEM URI: " + uri);
    }
    char c = text[pos];
    if (c == '"') {
        bool plain = false;
        string str = s_ParseQuoted(text, pos, uri, &plain);
        if (plain) {
            return CCimValue(str);
        }
        if (s_LooksLikeDateTime(str)) {
            return CCimValue(CCimDateTime(str));
        }
        if (s_LooksLikeInstancePath(str)) {
            try {
                return CCimValue(*CCimInstanceName::FromWbemUri(str));
            }
            catch (CCimException& e) {
                ERR_POST_X(3, Info << "Keybinding value \"" << str
                           << "\" kept as a string: " << e.GetMsg());
            }
        }
        return CCimValue(str);
    }
    if (c == '\'') {
        string str = s_ParseQuoted(text, pos, uri);
        if (s_CountCodePoints(str) != 1) {
            NCBI_THROW(CCimException, eValue,
                       "Char16 keybinding value '" + str +
                       "' must be one character in WBEM URI: " + uri);
        }
        return CCimValue::MakeChar16(str);
    }
    SIZE_TYPE end = text.find(',', pos);
    if (end == NPOS) {
        end = text.size();
    }
    string token = text.substr(pos, end - pos);
    pos = end;
    return s_ParseUnquoted(token, uri);
}


static void s_ParseKeybindings(const string& text, const string& uri,
                               TCimNamedValues& keybindings)
{
    if (text.empty()) {
        return;
    }
    SIZE_TYPE pos = 0;
    for (;;) {
        SIZE_TYPE eq = text.find('=', pos);
        if (eq == NPOS) {
            NCBI_THROW(CCimException, eValue,
                       "Missing '=' in keybinding of WBEM URI: " + uri);
        }
        string key = text.substr(pos, eq - pos);
        s_CheckName(key, "keybinding name", uri);
        pos = eq + 1;
        if (pos < text.size()  &&  text[pos] == '=') {
            NCBI_THROW(CCimException, eValue,
                       "Double '=' in keybinding '" + key +
                       "' of WBEM URI: " + uri);
        }
        CCimValue value = s_ParseKeyValue(text, pos, uri);
        keybindings.push_back(TCimNamedValues::value_type(key, value));
        if (pos == text.size()) {
            break;
        }
        if (text[pos] != ',') {
            NCBI_THROW(CCimException, eValue,
                       "Missing ',' after keybinding '" + key +
                       "' of WBEM URI: " + uri);
        }
        ++pos;
        if (pos == text.size()) {
            NCBI_THROW(CCimException, eValue,
                       "Trailing ',' in WBEM URI: " + uri);
        }
    }
}


void NWbemUri::Parse(const string& uri, SWbemUriParts& parts)
{
    parts = SWbemUriParts();
    SIZE_TYPE pos = 0;

    // Scheme, only in front of '/'
    SIZE_TYPE colon = uri.find(':');
    if (colon != NPOS  &&  colon > 0  &&  colon + 1 < uri.size()  &&
        uri[colon + 1] == '/'  &&  isalpha((unsigned char) uri[0])) {
        string scheme = uri.substr(0, colon);
        bool is_scheme = true;
        ITERATE(string, it, scheme) {
            is_scheme = is_scheme  &&  s_IsSchemeChar(*it);
        }
        if (is_scheme) {
            if (uri.compare(colon + 1, 2, "//") != 0) {
                NCBI_THROW(CCimException, eValue,
                           "Missing authority delimiter '//' after scheme '" +
                           scheme + "' in WBEM URI: " + uri);
            }
            bool known = false;
            for (size_t i = 0;  i < ArraySize(kKnownSchemes);  ++i) {
                known = known  ||  NStr::EqualNocase(scheme, kKnownSchemes[i]);
            }
            if ( !known ) {
                ERR_POST_X(1, Warning << "Unknown scheme '" << scheme
                           << "' in WBEM URI: " << uri);
            }
            pos = colon + 1;
        }
    }

    // Authority
    if (uri.compare(pos, 2, "//") == 0) {
        SIZE_TYPE slash = uri.find('/', pos + 2);
        if (slash == NPOS) {
            NCBI_THROW(CCimException, eValue,
                       "Missing '/' after the authority in WBEM URI: " + uri);
        }
        string host = uri.substr(pos + 2, slash - pos - 2);
        if ( !host.empty() ) {
            parts.host = host;
        }
        pos = slash + 1;
    } else if (pos < uri.size()  &&  uri[pos] == '/') {
        ++pos;
    }

    // Namespace and class name
    string rest = uri.substr(pos);
    SIZE_TYPE ns_end = s_FindNamespaceEnd(rest, 0);
    SIZE_TYPE class_pos = ns_end == NPOS ? 0 : ns_end + 1;
    SIZE_TYPE dot = rest.find('.', class_pos);
    if (ns_end != NPOS) {
        string name_space = rest.substr(0, ns_end);
        if ( !name_space.empty() ) {
            s_CheckNamespace(name_space, uri);
            parts.name_space = name_space;
        }
    }
    parts.classname = dot == NPOS ? rest.substr(class_pos)
                                  : rest.substr(class_pos, dot - class_pos);
    s_CheckName(parts.classname, "class name", uri);

    if (dot != NPOS) {
        parts.has_keys = true;
        s_ParseKeybindings(rest.substr(dot + 1), uri, parts.keybindings);
    }
}


static string s_Lower(const string& text)
{
    string ret(text);
    NStr::ToLower(ret);
    return ret;
}


string NWbemUri::FormatPath(const CNullable<string>& host,
                            const CNullable<string>& name_space,
                            const string&            classname,
                            EWbemUriFormat           format)
{
    bool lower = format == eWbemUri_Canonical;
    string ret;
    if (format != eWbemUri_CimObject  &&  !host.IsNull()) {
        ret += "//";
        ret += lower ? s_Lower(host) : string(host);
        ret += '/';
    } else if (format == eWbemUri_Standard  ||  format == eWbemUri_Canonical) {
        ret += '/';
    }
    if ( !name_space.IsNull() ) {
        ret += lower ? s_Lower(name_space) : string(name_space);
        ret += ':';
    } else if (format != eWbemUri_Historical) {
        ret += ':';
    }
    ret += lower ? s_Lower(classname) : classname;
    return ret;
}


// An escaped first character marks a string that would otherwise be read
// back as a datetime or a nested instance path
static string s_Quote(const string& text, char quote,
                      bool escape_first = false)
{
    string ret(1, quote);
    ITERATE(string, it, text) {
        if (*it == '\\'  ||  *it == quote  ||
            (escape_first  &&  it == text.begin())) {
            ret += '\\';
        }
        ret += *it;
    }
    ret += quote;
    return ret;
}


string NWbemUri::FormatKeyValue(const CCimValue& value, EWbemUriFormat format)
{
    switch (value.GetKind()) {
    case CCimValue::eKind_Null:
        return kEmptyStr;
    case CCimValue::eKind_Boolean:
        return value.GetBoolean() ? "TRUE" : "FALSE";
    case CCimValue::eKind_String:
        return s_Quote(value.GetString(), '"',
                       s_LooksLikeDateTime(value.GetString())  ||
                       s_LooksLikeInstancePath(value.GetString()));
    case CCimValue::eKind_Char16:
        return s_Quote(value.GetString(), '\'');
    case CCimValue::eKind_Integer:
        return value.IsNegative() ? NStr::Int8ToString(value.GetInt8())
                                  : NStr::UInt8ToString(value.GetUint8());
    case CCimValue::eKind_Real:
        // Full double precision, the key value is read back untyped
        return CCimValue::FormatReal(value.GetReal(), eCimType_real64);
    case CCimValue::eKind_DateTime:
        return '"' + value.GetDateTime().AsString() + '"';
    case CCimValue::eKind_InstanceName:
        return s_Quote(value.GetInstanceName().ToWbemUri(format), '"');
    case CCimValue::eKind_ClassName:
        return s_Quote(value.GetClassName().ToWbemUri(format), '"');
    default:
        break;
    }
    NCBI_THROW(CCimException, eType,
               "Value " + value.AsString() +
               " cannot be a keybinding value of a WBEM URI");
}


struct PKeyLess
{
    bool operator()(const pair<string, const CCimValue*>& a,
                    const pair<string, const CCimValue*>& b) const
        { return NStr::CompareNocase(a.first, b.first) < 0; }
};


string NWbemUri::FormatKeybindings(const CNocaseDict<CCimValue>& keys,
                                   EWbemUriFormat format)
{
    typedef vector< pair<string, const CCimValue*> > TSorted;
    TSorted sorted;
    ITERATE(CNocaseDict<CCimValue>, it, keys) {
        string name = format == eWbemUri_Canonical ? s_Lower(it->first)
                                                   : it->first;
        sorted.push_back(TSorted::value_type(name, &it->second));
    }
    stable_sort(sorted.begin(), sorted.end(), PKeyLess());

    string ret;
    ITERATE(TSorted, it, sorted) {
        if ( !ret.empty() ) {
            ret += ',';
        }
        ret += it->first;
        ret += '=';
        ret += FormatKeyValue(*it->second, format);
    }
    return ret;
}


END_WBEM_SCOPE
