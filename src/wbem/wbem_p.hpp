#ifndef WBEM___WBEM_P__HPP
#define WBEM___WBEM_P__HPP

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
 *   Private helpers shared by the CIM object implementations
 *
 */

#include <wbem/nocase_dict.hpp>
#include <wbem/cim_value.hpp>
#include <functional>


BEGIN_WBEM_SCOPE


/// Hash of a name, ignoring case
inline
size_t HashNocase(const string& name)
{
    string lower(name);
    NStr::ToLower(lower);
    return hash<string>()(lower);
}

inline
size_t HashCombine(size_t seed, size_t value)
{
    return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}


template <class TValue>
inline
bool NullableEqual(const CNullable<TValue>& a, const CNullable<TValue>& b)
{
    if (a.IsNull()  ||  b.IsNull()) {
        return a.IsNull()  &&  b.IsNull();
    }
    return TValue(a) == TValue(b);
}

inline
bool NullableEqualNocase(const CNullable<string>& a,
                         const CNullable<string>& b)
{
    if (a.IsNull()  ||  b.IsNull()) {
        return a.IsNull()  &&  b.IsNull();
    }
    return NStr::EqualNocase(string(a), string(b));
}

inline
size_t NullableHashNocase(const CNullable<string>& value)
{
    return value.IsNull() ? 0x5f5 : HashNocase(string(value));
}

template <class TValue>
inline
size_t NullableHash(const CNullable<TValue>& value)
{
    return value.IsNull() ? 0x5f5 : size_t(TValue(value)) + 1;
}


inline size_t GetItemHash(bool value)   { return value ? 1 : 2; }
template <class TValue>
inline size_t GetItemHash(const TValue& value) { return value.GetHash(); }

/// Hash of a case-insensitive dictionary that does not depend on the
/// order of its items
template <class TValue>
size_t HashNocaseDict(const CNocaseDict<TValue>& dict)
{
    size_t ret = dict.size();
    ITERATE(typename CNocaseDict<TValue>, it, dict) {
        ret += HashCombine(HashNocase(it->first), GetItemHash(it->second));
    }
    return ret;
}


/// Type given explicitly, or the type inferred from the value.
/// Throw CCimException::eValue if the value is NULL (or holds only NULLs),
/// CCimException::eType if it is an untyped number.
inline
ECimType ResolveCimType(const TCimTypeArg& type, const CCimValue& value,
                        const char* what, const string& name)
{
    if ( !type.IsNull() ) {
        return type;
    }
    TCimTypeArg inferred = value.InferCimType();
    if ( !inferred.IsNull() ) {
        return inferred;
    }
    bool has_value = !value.IsNull();
    if (value.IsArray()) {
        has_value = false;
        ITERATE(CCimValue::TArray, it, value.GetArray()) {
            has_value = has_value  ||  !it->IsNull();
        }
    }
    if (has_value) {
        NCBI_THROW(CCimException, eType,
                   string("Cannot infer the CIM type of ") + what + " '" +
                   name + "' from untyped value " + value.AsString() +
                   "; the type must be specified");
    }
    NCBI_THROW(CCimException, eValue,
               string("Cannot infer the CIM type of ") + what + " '" +
               name + "' without a value; the type must be specified");
}

/// Namespace without leading and trailing slashes
inline
string StripNamespace(const string& name_space)
{
    SIZE_TYPE start = name_space.find_first_not_of('/');
    if (start == NPOS) {
        return kEmptyStr;
    }
    SIZE_TYPE end = name_space.find_last_not_of('/');
    return name_space.substr(start, end - start + 1);
}

inline
void CheckName(const string& name, const char* what)
{
    if (name.empty()) {
        NCBI_THROW(CCimException, eValue,
                   string("Name of ") + what + " must not be empty");
    }
}



/////////////////////////////////////////////////////////////////////////////
//  Normalization of the container arguments (properties, qualifiers,
//  methods, parameters) into case-insensitive dictionaries.


/// Store a named object under 'key'. The object's own name must match the
/// key, ignoring case.
template <class TObject>
void AddNamedObject(CNocaseDict<TObject>& dict, const string& key,
                    const TObject& obj)
{
    if ( !NStr::EqualNocase(key, obj.GetName()) ) {
        NCBI_THROW(CCimException, eValue,
                   "Name of the object '" + obj.GetName() +
                   "' does not match its key '" + key + "'");
    }
    dict.Set(key, obj);
}

template <class TObject>
CNocaseDict<TObject> BuildNamedObjects(const CNocaseDict<TObject>& src)
{
    CNocaseDict<TObject> dict;
    ITERATE(typename CNocaseDict<TObject>, it, src) {
        AddNamedObject(dict, it->first, it->second);
    }
    return dict;
}

template <class TObject>
CNocaseDict<TObject> BuildNamedObjects(const vector<TObject>& src)
{
    CNocaseDict<TObject> dict;
    ITERATE(typename vector<TObject>, it, src) {
        dict.Set(it->GetName(), *it);
    }
    return dict;
}

/// Objects are constructed from (name, value), inferring the type
template <class TObject>
CNocaseDict<TObject> BuildNamedObjects(const TCimNamedValues& src)
{
    CNocaseDict<TObject> dict;
    ITERATE(TCimNamedValues, it, src) {
        dict.Set(it->first, TObject(it->first, it->second));
    }
    return dict;
}


END_WBEM_SCOPE

#endif  /* WBEM___WBEM_P__HPP */
