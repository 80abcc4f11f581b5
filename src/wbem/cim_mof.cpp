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
 *   MOF (Managed Object Format) text rendering helpers
 *
 */

#include <ncbi_pch.hpp>
#include <wbem/cim_mof.hpp>
#include <wbem/cim_qualifier.hpp>
#include <wbem/cim_instance_name.hpp>
#include <wbem/cim_class_name.hpp>
#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/wbem_uri.hpp>
#include <stdio.h>


BEGIN_WBEM_SCOPE


const unsigned int NMof::kIndent;
const unsigned int NMof::kMaxLine;


// One source character in its escaped form; occupies one column per
// character of the escape sequence, one column for a multibyte character.
struct SMofToken
{
    string       text;
    unsigned int width;
    bool         blank;
};

typedef vector<SMofToken> TMofTokens;


static void s_Tokenize(const string& value, TMofTokens& tokens)
{
    for (SIZE_TYPE i = 0;  i < value.size();  ) {
        unsigned char c = (unsigned char) value[i];
        SMofToken tok;
        tok.blank = c == ' ';
        tok.width = 1;
        if (c >= 0x80) {
            // UTF-8 sequence: lead byte and continuation bytes
            SIZE_TYPE end = i + 1;
            while (end < value.size()  &&
                   ((unsigned char) value[end] & 0xC0) == 0x80) {
                ++end;
            }
            tok.text = value.substr(i, end - i);
            i = end;
        } else {
            switch (c) {
            case '\b':  tok.text = "\\b";   break;
            case '\t':  tok.text = "\\t";   break;
            case '\n':  tok.text = "\\n";   break;
            case '\f':  tok.text = "\\f";   break;
            case '\r':  tok.text = "\\r";   break;
            case '\\':  tok.text = "\\\\";  break;
            case '"':   tok.text = "\\\"";  break;
            case '\'':  tok.text = "\\'";   break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    sprintf(buf, "\\x%04X", (unsigned int) c);
                    tok.text = buf;
                } else {
                    tok.text = string(1, (char) c);
                }
                break;
            }
            tok.width = (unsigned int) tok.text.size();
            ++i;
        }
        tokens.push_back(tok);
    }
}


string NMof::MofStr(const string&  value,
                    unsigned int   indent,
                    unsigned int&  line_pos,
                    unsigned int   end_space,
                    char           quote)
{
    TMofTokens tokens;
    s_Tokenize(value, tokens);

    // Words end after a blank
    vector<TMofTokens> words;
    words.push_back(TMofTokens());
    ITERATE(TMofTokens, it, tokens) {
        words.back().push_back(*it);
        if (it->blank) {
            words.push_back(TMofTokens());
        }
    }
    if (words.size() > 1  &&  words.back().empty()) {
        words.pop_back();
    }

    string mof(1, quote);
    unsigned int pos = line_pos + 1;
    bool line_empty = true;

    for (size_t w = 0;  w < words.size();  ++w) {
        const TMofTokens& word = words[w];
        unsigned int width = 0;
        ITERATE(TMofTokens, it, word) {
            width += it->width;
        }
        // Room for the closing quote, and what follows the last word
        unsigned int reserve = 1 + (w + 1 == words.size() ? end_space : 0);
        if (pos + width + reserve <= kMaxLine) {
            ITERATE(TMofTokens, it, word) {
                mof += it->text;
            }
            pos += width;
            line_empty = line_empty  &&  width == 0;
            continue;
        }
        if ( !line_empty ) {
            mof += quote;
            mof += '\n';
            mof += Indent(indent);
            mof += quote;
            pos = indent + 1;
            line_empty = true;
        }
        // Split the word at the column boundary where it still does not fit
        ITERATE(TMofTokens, it, word) {
            if ( !line_empty  &&  pos + it->width + reserve > kMaxLine) {
                mof += quote;
                mof += '\n';
                mof += Indent(indent);
                mof += quote;
                pos = indent + 1;
            }
            mof += it->text;
            pos += it->width;
            line_empty = false;
        }
    }
    mof += quote;
    line_pos = pos + 1;
    return mof;
}


string NMof::ValueToMof(const CCimValue&  value,
                        ECimType          type,
                        unsigned int      indent,
                        unsigned int&     line_pos,
                        unsigned int      end_space)
{
    if (value.IsArray()) {
        if (value.GetArray().empty()) {
            line_pos += 3;
            return "{ }";
        }
        line_pos += 2;
        string mof = "{ " +
            ArrayItemsToMof(value, type, indent, line_pos, end_space + 2);
        line_pos += 2;
        return mof + " }";
    }

    string text;
    switch (value.GetKind()) {
    case CCimValue::eKind_Null:
        text = "NULL";
        break;
    case CCimValue::eKind_Boolean:
        text = value.GetBoolean() ? "true" : "false";
        break;
    case CCimValue::eKind_String:
    case CCimValue::eKind_Char16:
        return MofStr(value.GetString(), indent, line_pos, end_space,
                      (type == eCimType_char16  ||  value.IsChar16())
                      ? '\'' : '"');
    case CCimValue::eKind_Integer:
        text = value.IsNegative() ? NStr::Int8ToString(value.GetInt8())
                                  : NStr::UInt8ToString(value.GetUint8());
        break;
    case CCimValue::eKind_Real:
        text = CCimValue::FormatReal(value.GetReal(),
                                     IsRealType(type) ? type
                                                      : eCimType_real64);
        break;
    case CCimValue::eKind_DateTime:
        return MofStr(value.GetDateTime().AsString(), indent, line_pos,
                      end_space);
    case CCimValue::eKind_InstanceName:
        return MofStr(value.GetInstanceName().ToWbemUri(), indent, line_pos,
                      end_space);
    case CCimValue::eKind_ClassName:
        return MofStr(value.GetClassName().ToWbemUri(), indent, line_pos,
                      end_space);
    case CCimValue::eKind_Instance:
        return MofStr(value.GetInstance().ToMof(), indent, line_pos,
                      end_space);
    case CCimValue::eKind_Class:
        return MofStr(value.GetClass().ToMof(), indent, line_pos,
                      end_space);
    default:
        NCBI_THROW(CCimException, eType,
                   "Value " + value.AsString() + " has no MOF form");
    }
    line_pos += (unsigned int) text.size();
    return text;
}


string NMof::ArrayItemsToMof(const CCimValue&  value,
                             ECimType          type,
                             unsigned int      indent,
                             unsigned int&     line_pos,
                             unsigned int      end_space)
{
    string mof;
    const CCimValue::TArray& items = value.GetArray();
    for (size_t i = 0;  i < items.size();  ++i) {
        unsigned int item_end = i + 1 == items.size() ? end_space : 1;
        if (i > 0) {
            // Move the item to the next line if its first line does not fit
            unsigned int trial_pos = line_pos + 2;
            string trial = ValueToMof(items[i], type, indent, trial_pos,
                                      item_end);
            SIZE_TYPE first_line = trial.find('\n');
            if (first_line == NPOS) {
                first_line = trial.size();
            }
            if (line_pos + 2 + first_line + item_end > kMaxLine) {
                mof += ",\n" + Indent(indent);
                line_pos = indent;
            } else {
                mof += ", ";
                line_pos += 2;
            }
        }
        mof += ValueToMof(items[i], type, indent, line_pos, item_end);
    }
    return mof;
}


string NMof::QualifiersToMof(const CNocaseDict<CCimQualifier>& quals,
                             unsigned int indent)
{
    if (quals.empty()) {
        return kEmptyStr;
    }

    string one_line;
    unsigned int line_pos = indent + 1;
    ITERATE(CNocaseDict<CCimQualifier>, it, quals) {
        if ( !one_line.empty() ) {
            one_line += ", ";
            line_pos += 2;
        }
        string qual = it->second.ToMof(indent + 1 + kIndent, line_pos);
        one_line += qual;
        line_pos += (unsigned int) qual.size();
    }
    if (one_line.find('\n') == NPOS  &&
        indent + one_line.size() + 2 <= kMaxLine) {
        return Indent(indent) + "[" + one_line + "]\n";
    }

    string mof = Indent(indent) + "[";
    bool first = true;
    ITERATE(CNocaseDict<CCimQualifier>, it, quals) {
        if ( !first ) {
            mof += ",\n" + Indent(indent + 1);
        }
        first = false;
        mof += it->second.ToMof(indent + 1 + kIndent, indent + 1);
    }
    return mof + "]\n";
}


string NMof::TypeToMof(ECimType type, const string& reference_class)
{
    if (type == eCimType_reference) {
        return reference_class.empty() ? string("REF")
                                       : reference_class + " REF";
    }
    return GetCimTypeName(type);
}


END_WBEM_SCOPE
