#ifndef WBEM___CIM_MOF__HPP
#define WBEM___CIM_MOF__HPP

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

/// @file cim_mof.hpp
/// Building blocks of the MOF representation (DSP0004, annex A).
///
/// The CIM objects render themselves with ToMof(); this class holds the
/// string literal, value and qualifier list rendering they share.

#include <wbem/cim_value.hpp>
#include <wbem/nocase_dict.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


class CCimQualifier;


class NCBI_XWBEM_EXPORT NMof
{
public:
    /// Columns per nesting level
    static const unsigned int kIndent = 3;
    /// Lines are wrapped to fit this width where possible
    static const unsigned int kMaxLine = 80;

    /// MOF string literal for 'value', with the surrounding quotes.
    ///
    /// Backspace, tab, newline, formfeed and carriage return get named
    /// escapes, other control characters \xXXXX, and backslash and both
    /// quote characters are backslash escaped. Every input character is
    /// escaped on its own.
    ///
    /// The literal is split into several adjacent literals when it does
    /// not fit into the line, preferably after a blank; continuation
    /// lines are indented by 'indent' columns. 'end_space' columns are
    /// reserved after the literal on its last line.
    ///
    /// @param line_pos
    ///   In: column where the literal starts. Out: column after it.
    static string MofStr(const string&  value,
                         unsigned int   indent,
                         unsigned int&  line_pos,
                         unsigned int   end_space = 0,
                         char           quote = '"');

    /// MOF text of a value of the given type: NULL, literals, and
    /// "{ v1, v2 }" for arrays. References become WBEM URI string literals,
    /// embedded objects string literals with their MOF text.
    static string ValueToMof(const CCimValue&  value,
                             ECimType          type,
                             unsigned int      indent,
                             unsigned int&     line_pos,
                             unsigned int      end_space = 0);

    /// Array elements "v1, v2" without braces
    static string ArrayItemsToMof(const CCimValue&  value,
                                  ECimType          type,
                                  unsigned int      indent,
                                  unsigned int&     line_pos,
                                  unsigned int      end_space = 0);

    /// Qualifier list "[Q1 ( v1 ), Q2]" indented by 'indent' columns and
    /// followed by a newline; empty string if there are no qualifiers.
    /// The list is put on one line if it fits, otherwise each qualifier
    /// goes on its own line.
    static string QualifiersToMof(const CNocaseDict<CCimQualifier>& quals,
                                  unsigned int indent);

    /// "uint32", or "ClassName REF" for references
    static string TypeToMof(ECimType type, const string& reference_class);

    /// 'n' blanks
    static string Indent(unsigned int n) { return string(n, ' '); }
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_MOF__HPP */
