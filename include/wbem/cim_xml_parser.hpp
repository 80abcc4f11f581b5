#ifndef WBEM___CIM_XML_PARSER__HPP
#define WBEM___CIM_XML_PARSER__HPP

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
 *   CIM-XML (DSP0201) object parser
 *
 */

/// @file cim_xml_parser.hpp
/// NCimXmlParser -- rebuild CIM objects from CIM-XML element trees.

#include <wbem/cim_instance.hpp>
#include <wbem/cim_class.hpp>
#include <wbem/cim_qualifier_decl.hpp>
#include <misc/xmlwrapp/xmlwrapp.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// NCimXmlParser --
///
/// Reverse of the ToCimXml() methods of the object model. Every entry
/// point accepts either an xmlwrapp element or the text of a document
/// whose root is the element.
///
/// Malformed XML, unexpected elements and missing or invalid attributes
/// raise CCimException::eParse. Values that do not fit their declared
/// type raise the errors of CCimValue::ConvertTo().

class NCBI_XWBEM_EXPORT NCimXmlParser
{
public:
    /// INSTANCENAME, LOCALINSTANCEPATH or INSTANCEPATH
    static CRef<CCimInstanceName> ParseInstanceName(
        const xml::node&   node,
        const CWbemConfig& config = CWbemConfig());
    static CRef<CCimInstanceName> ParseInstanceName(
        const string&      text,
        const CWbemConfig& config = CWbemConfig());

    /// CLASSNAME, LOCALCLASSPATH or CLASSPATH
    static CRef<CCimClassName> ParseClassName(const xml::node& node);
    static CRef<CCimClassName> ParseClassName(const string& text);

    /// INSTANCE, VALUE.NAMEDINSTANCE, VALUE.OBJECTWITHLOCALPATH or
    /// VALUE.INSTANCEWITHPATH
    static CRef<CCimInstance> ParseInstance(const xml::node& node);
    static CRef<CCimInstance> ParseInstance(const string& text);

    /// CLASS
    static CRef<CCimClass> ParseClass(const xml::node& node);
    static CRef<CCimClass> ParseClass(const string& text);

    /// PROPERTY, PROPERTY.ARRAY or PROPERTY.REFERENCE
    static CCimProperty ParseProperty(const xml::node& node);
    static CCimProperty ParseProperty(const string& text);

    /// QUALIFIER
    static CCimQualifier ParseQualifier(const xml::node& node);
    static CCimQualifier ParseQualifier(const string& text);

    /// QUALIFIER.DECLARATION
    static CCimQualifierDeclaration ParseQualifierDeclaration(
        const xml::node& node);
    static CCimQualifierDeclaration ParseQualifierDeclaration(
        const string& text);

    /// METHOD
    static CCimMethod ParseMethod(const xml::node& node);
    static CCimMethod ParseMethod(const string& text);

    /// PARAMETER, PARAMETER.ARRAY, PARAMETER.REFERENCE, PARAMETER.REFARRAY
    /// or PARAMVALUE
    static CCimParameter ParseParameter(const xml::node& node);
    static CCimParameter ParseParameter(const string& text);

    /// VALUE, VALUE.NULL, VALUE.ARRAY, VALUE.REFERENCE or VALUE.REFARRAY.
    /// Text is converted to the given type, if any, or kept as string.
    /// With an embedded object marker the text is itself parsed as an
    /// INSTANCE or CLASS element.
    static CCimValue ParseValue(const xml::node& node,
                                TCimTypeArg      type     = null,
                                EEmbeddedObject  embedded = eEmbeddedObject_None);
};


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_XML_PARSER__HPP */
