#ifndef WBEM___NOCASE_DICT__HPP
#define WBEM___NOCASE_DICT__HPP

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
 *   Ordered dictionary with case-insensitive string keys
 *
 */

/// @file nocase_dict.hpp
/// CNocaseDict -- ordered mapping with case-insensitive string keys.

#include <wbem/exception.hpp>
#include <corelib/ncbistr.hpp>
#include <list>
#include <map>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CNocaseDict --
///
/// Mapping from string keys to values. Keys compare case-insensitively,
/// the lexical case of the most recently stored key is preserved, and
/// iteration follows insertion order. Replacing the value of an existing
/// key keeps its position.

template <class TValue>
class CNocaseDict
{
public:
    typedef TValue                          mapped_type;
    typedef pair<string, TValue>            value_type;
    typedef list<value_type>                TItems;
    typedef typename TItems::const_iterator const_iterator;
    typedef typename TItems::iterator       iterator;

    CNocaseDict(void) {}
    CNocaseDict(const CNocaseDict& other)
        { x_Assign(other); }
    CNocaseDict& operator=(const CNocaseDict& other)
        {
            if (this != &other) {
                x_Assign(other);
            }
            return *this;
        }

    size_t size(void) const  { return m_Items.size(); }
    bool   empty(void) const { return m_Items.empty(); }
    void   clear(void)       { m_Index.clear();  m_Items.clear(); }

    const_iterator begin(void) const { return m_Items.begin(); }
    const_iterator end(void) const   { return m_Items.end(); }
    /// Values may be changed in place; keys must not be.
    iterator begin(void) { return m_Items.begin(); }
    iterator end(void)   { return m_Items.end(); }

    bool Has(const string& key) const
        { return m_Index.find(key) != m_Index.end(); }

    /// Return NULL if the key is not present.
    const TValue* Find(const string& key) const
        {
            typename TIndex::const_iterator it = m_Index.find(key);
            return it == m_Index.end() ? 0 : &it->second->second;
        }
    TValue* Find(const string& key)
        {
            typename TIndex::iterator it = m_Index.find(key);
            return it == m_Index.end() ? 0 : &it->second->second;
        }

    /// Throw CCimException::eKey if the key is not present.
    const TValue& Get(const string& key) const
        {
            const TValue* value = Find(key);
            if ( !value ) {
                NCBI_THROW(CCimException, eKey, "No such key: '" + key + "'");
            }
            return *value;
        }
    TValue& Get(const string& key)
        {
            TValue* value = Find(key);
            if ( !value ) {
                NCBI_THROW(CCimException, eKey, "No such key: '" + key + "'");
            }
            return *value;
        }

    /// Stored spelling of the key.
    const string& GetKey(const string& key) const
        {
            typename TIndex::const_iterator it = m_Index.find(key);
            if (it == m_Index.end()) {
                NCBI_THROW(CCimException, eKey, "No such key: '" + key + "'");
            }
            return it->second->first;
        }

    void Set(const string& key, const TValue& value)
        {
            typename TIndex::iterator it = m_Index.find(key);
            if (it != m_Index.end()) {
                iterator item = it->second;
                item->first  = key;
                item->second = value;
                m_Index.erase(it);
                m_Index.insert(typename TIndex::value_type(key, item));
            } else {
                m_Items.push_back(value_type(key, value));
                iterator item = m_Items.end();
                --item;
                m_Index.insert(typename TIndex::value_type(key, item));
            }
        }

    /// Throw CCimException::eKey if the key is not present.
    void Erase(const string& key)
        {
            typename TIndex::iterator it = m_Index.find(key);
            if (it == m_Index.end()) {
                NCBI_THROW(CCimException, eKey, "No such key: '" + key + "'");
            }
            m_Items.erase(it->second);
            m_Index.erase(it);
        }

    vector<string> GetKeys(void) const
        {
            vector<string> keys;
            ITERATE(typename TItems, it, m_Items) {
                keys.push_back(it->first);
            }
            return keys;
        }

    /// Same set of keys (ignoring case) with equal values, in any order.
    bool operator==(const CNocaseDict& other) const
        {
            if (size() != other.size()) {
                return false;
            }
            ITERATE(typename TItems, it, m_Items) {
                const TValue* value = other.Find(it->first);
                if ( !value  ||  !(*value == it->second) ) {
                    return false;
                }
            }
            return true;
        }
    bool operator!=(const CNocaseDict& other) const
        { return !(*this == other); }

private:
    typedef map<string, iterator, PNocase> TIndex;

    void x_Assign(const CNocaseDict& other)
        {
            clear();
            ITERATE(typename TItems, it, other.m_Items) {
                Set(it->first, it->second);
            }
        }

    TItems m_Items;
    TIndex m_Index;
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___NOCASE_DICT__HPP */
