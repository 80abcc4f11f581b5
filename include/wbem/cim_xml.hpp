#ifndef WBEM___CIM_XML__HPP
#define WBEM___CIM_XML__HPP

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
 *   CIM-XML (DSP0201) element construction helpers
 *
 */

/// @file cim_xml.hpp
/// Building blocks of the CIM-XML representation (DSP0201).
///
/// The CIM objects render themselves with ToCimXml(); this class holds the
/// pieces they share: value elements, namespace paths, flag attributes and
/// conversion of element trees to text.

#include <wbem/cim_value.hpp>
#include <misc/xmlwrapp/xmlwrapp.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


class NCBI_XWBEM_EXPORT NCimXml
{
public:
    /// <VALUE>text</VALUE>; special characters of the text are escaped
    static xml::node CreateValue(const string& text);

    /// <VALUE.NULL/>
    static xml::node CreateValueNull(void);

    /// Text of a scalar VALUE element:
    /// TRUE/FALSE, decimal numbers, INF/-INF/NaN, datetime strings, and
    /// the single-line CIM-XML of embedded objects.
    /// Throw CCimException::eType for NULL, arrays and references.
    static string ScalarToText(const CCimValue& value);

    /// Element for a non-NULL value of the given type:
    /// VALUE, VALUE.REFERENCE, VALUE.ARRAY or VALUE.REFARRAY.
    /// NULL array elements become VALUE.NULL.
    static xml::node ValueToCimXml(const CCimValue& value, ECimType type);

    /// <VALUE.REFERENCE> for an instance or class path value
    static xml::node CreateValueReference(const CCimValue& value);

    /// <LOCALNAMESPACEPATH> with one NAMESPACE per '/' separated component
    static xml::node CreateLocalNamespacePath(const string& name_space);

    /// <NAMESPACEPATH><HOST/><LOCALNAMESPACEPATH/></NAMESPACEPATH>
    static xml::node CreateNamespacePath(const string& host,
                                         const string& name_space);

    /// Add attribute NAME="true|false" unless the flag is not specified
    static void AddFlag(xml::node& node, const char* name,
                        const TCimFlag& flag);

    static void AddAttr(xml::node& node, const char* name,
                        const string& value);

    /// Single line text of an element
    static string NodeToString(const xml::node& node);
    /// Indented multi-line text of an element
    static string NodeToString(const xml::node& node, const string& indent);
    static string NodeToString(const xml::node& node, unsigned int indent);
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_XML__HPP */
