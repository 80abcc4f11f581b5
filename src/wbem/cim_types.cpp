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

#include <ncbi_pch.hpp>
#include <wbem/cim_types.hpp>
#include <corelib/ncbi_limits.h>


BEGIN_WBEM_SCOPE


struct SCimTypeName {
    const char* m_Name;
    ECimType    m_Type;
};

static const SCimTypeName s_CimTypeNames[] = {
    { "boolean",   eCimType_boolean   },
    { "string",    eCimType_string    },
    { "char16",    eCimType_char16    },
    { "datetime",  eCimType_datetime  },
    { "reference", eCimType_reference },
    { "uint8",     eCimType_uint8     },
    { "uint16",    eCimType_uint16    },
    { "uint32",    eCimType_uint32    },
    { "uint64",    eCimType_uint64    },
    { "sint8",     eCimType_sint8     },
    { "sint16",    eCimType_sint16    },
    { "sint32",    eCimType_sint32    },
    { "sint64",    eCimType_sint64    },
    { "real32",    eCimType_real32    },
    { "real64",    eCimType_real64    }
};


const char* GetCimTypeName(ECimType type)
{
    for (size_t i = 0;  i < ArraySize(s_CimTypeNames);  ++i) {
        if (s_CimTypeNames[i].m_Type == type) {
            return s_CimTypeNames[i].m_Name;
        }
    }
    NCBI_THROW_FMT(CCimException, eValue,
                   "Invalid CIM type tag: " << int(type));
}


ECimType GetCimTypeByName(const string& name)
{
    for (size_t i = 0;  i < ArraySize(s_CimTypeNames);  ++i) {
        if (NStr::EqualNocase(name, s_CimTypeNames[i].m_Name)) {
            return s_CimTypeNames[i].m_Type;
        }
    }
    NCBI_THROW(CCimException, eValue,
               "Invalid CIM type name: '" + name + "'");
}


bool IsIntegerType(ECimType type)
{
    return type >= eCimType_uint8  &&  type <= eCimType_sint64;
}


bool IsSignedType(ECimType type)
{
    return (type >= eCimType_sint8  &&  type <= eCimType_sint64)
        ||  IsRealType(type);
}


bool IsRealType(ECimType type)
{
    return type == eCimType_real32  ||  type == eCimType_real64;
}


void GetIntegerTypeRange(ECimType type, Int8* min_value, Uint8* max_value)
{
    switch ( type ) {
    case eCimType_uint8:
        *min_value = 0;            *max_value = kMax_UI1;  break;
    case eCimType_uint16:
        *min_value = 0;            *max_value = kMax_UI2;  break;
    case eCimType_uint32:
        *min_value = 0;            *max_value = kMax_UI4;  break;
    case eCimType_uint64:
        *min_value = 0;            *max_value = kMax_UI8;  break;
    case eCimType_sint8:
        *min_value = kMin_I1;      *max_value = kMax_I1;   break;
    case eCimType_sint16:
        *min_value = kMin_I2;      *max_value = kMax_I2;   break;
    case eCimType_sint32:
        *min_value = kMin_I4;      *max_value = kMax_I4;   break;
    case eCimType_sint64:
        *min_value = kMin_I8;      *max_value = kMax_I8;   break;
    default:
        NCBI_THROW(CCimException, eType,
                   string("Not an integer CIM type: ") + GetCimTypeName(type));
    }
}


END_WBEM_SCOPE
