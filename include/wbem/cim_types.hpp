#ifndef WBEM___CIM_TYPES__HPP
#define WBEM___CIM_TYPES__HPP

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
 *   CIM data type tags
 *
 */

/// @file cim_types.hpp
/// The fixed catalog of CIM primitive types (DSP0004).

#include <wbem/exception.hpp>
#include <corelib/ncbimisc.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/// CIM type tag
enum ECimType {
    eCimType_boolean,
    eCimType_string,
    eCimType_char16,
    eCimType_datetime,
    eCimType_reference,
    eCimType_uint8,
    eCimType_uint16,
    eCimType_uint32,
    eCimType_uint64,
    eCimType_sint8,
    eCimType_sint16,
    eCimType_sint32,
    eCimType_sint64,
    eCimType_real32,
    eCimType_real64
};

/// Type tag that may be absent (to be inferred)
typedef CNullable<ECimType>     TCimTypeArg;
/// Tri-state flag: true, false or not specified
typedef CNullable<bool>         TCimFlag;
/// Fixed array size, if any
typedef CNullable<unsigned int> TCimArraySize;


/// Type name as used in CIM-XML and MOF ("uint8", "reference", ...)
NCBI_XWBEM_EXPORT
extern const char* GetCimTypeName(ECimType type);

/// Reverse of GetCimTypeName(), case-insensitive.
/// Throw CCimException::eValue for an unknown type name.
NCBI_XWBEM_EXPORT
extern ECimType GetCimTypeByName(const string& name);

NCBI_XWBEM_EXPORT
extern bool IsIntegerType(ECimType type);

NCBI_XWBEM_EXPORT
extern bool IsSignedType(ECimType type);

NCBI_XWBEM_EXPORT
extern bool IsRealType(ECimType type);

inline
bool IsNumericType(ECimType type)
{
    return IsIntegerType(type)  ||  IsRealType(type);
}

/// Inclusive value range of an integer type.
/// Throw CCimException::eType if the type is not an integer type.
NCBI_XWBEM_EXPORT
extern void GetIntegerTypeRange(ECimType type, Int8* min_value,
                                Uint8* max_value);


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_TYPES__HPP */
