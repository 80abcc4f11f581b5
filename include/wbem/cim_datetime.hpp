#ifndef WBEM___CIM_DATETIME__HPP
#define WBEM___CIM_DATETIME__HPP

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
 *   CIM datetime value: a point in time or an interval
 *
 */

/// @file cim_datetime.hpp
/// CIM datetime type (DSP0004, 5.2.4).

#include <wbem/exception.hpp>
#include <corelib/ncbitime.hpp>


/** @addtogroup WBEM
 *
 * @{
 */


BEGIN_WBEM_SCOPE


/////////////////////////////////////////////////////////////////////////////
///
/// CCimDateTime --
///
/// Value of the CIM 'datetime' type. Holds either a point in time with its
/// UTC offset in minutes, or an interval (duration), never both.
///
/// String form, always 25 characters:
///   point in time:  yyyymmddhhmmss.mmmmmmsutc   (s is '+' or '-')
///   interval:       ddddddddhhmmss.mmmmmm:000
///
/// Equality and hash depend on the denoted value only: two points in time
/// are equal when they denote the same UTC instant, two intervals when they
/// have the same duration. A point in time never equals an interval.

class NCBI_XWBEM_EXPORT CCimDateTime
{
public:
    /// Zero interval
    CCimDateTime(void);

    /// Parse a CIM datetime string.
    /// Throw CCimException::eValue if it is malformed.
    explicit CCimDateTime(const string& dtstr);

    /// Point in time. A local CTime keeps its local time zone offset,
    /// a GMT one gets offset 0.
    explicit CCimDateTime(const CTime& time);

    /// Interval. Throw CCimException::eValue for a negative span.
    explicit CCimDateTime(const CTimeSpan& span);

    static CCimDateTime CreatePointInTime(int year, int month, int day,
                                          int hour = 0,
                                          int minute = 0,
                                          int second = 0,
                                          int microsecond = 0,
                                          int minutes_from_utc = 0);

    static CCimDateTime CreateInterval(Uint8 days,
                                       int hours = 0,
                                       int minutes = 0,
                                       int seconds = 0,
                                       int microseconds = 0);

    /// Current local time, with the local UTC offset.
    static CCimDateTime Now(void);

    /// Point in time for a POSIX timestamp, expressed in the local time zone
    /// or with the given UTC offset.
    static CCimDateTime FromTimestamp(time_t timestamp);
    static CCimDateTime FromTimestamp(time_t timestamp, int minutes_from_utc);

    /// Offset of the local time zone from UTC, in minutes.
    static int GetLocalUtcOffset(void);

    bool IsInterval(void) const { return m_IsInterval; }

    /// Point in time fields (0 for an interval)
    int GetYear(void) const           { return m_Year; }
    int GetMonth(void) const          { return m_Month; }
    int GetDay(void) const            { return m_Day; }
    int GetMinutesFromUtc(void) const { return m_MinutesFromUtc; }

    /// Interval field (0 for a point in time)
    Uint8 GetDays(void) const { return m_Days; }

    int GetHour(void) const        { return m_Hour; }
    int GetMinute(void) const      { return m_Minute; }
    int GetSecond(void) const      { return m_Second; }
    int GetMicrosecond(void) const { return m_Microsecond; }

    /// Point in time as GMT CTime.
    /// Throw CCimException::eValue for an interval.
    CTime GetTime(void) const;

    /// Interval as CTimeSpan.
    /// Throw CCimException::eValue for a point in time.
    CTimeSpan GetTimeSpan(void) const;

    /// 25 character CIM datetime string
    string AsString(void) const;

    bool operator==(const CCimDateTime& other) const;
    bool operator!=(const CCimDateTime& other) const
        { return !(*this == other); }

    size_t GetHash(void) const;

private:
    void x_Parse(const string& dtstr);
    void x_Validate(void) const;
    // Microseconds since 0001-01-01T00:00:00 UTC, or duration
    Int8 x_GetValue(void) const;

    bool  m_IsInterval;
    int   m_Year;
    int   m_Month;
    int   m_Day;
    Uint8 m_Days;
    int   m_Hour;
    int   m_Minute;
    int   m_Second;
    int   m_Microsecond;
    int   m_MinutesFromUtc;
};


inline
CNcbiOstream& operator<<(CNcbiOstream& out, const CCimDateTime& dt)
{
    return out << dt.AsString();
}


END_WBEM_SCOPE


/* @} */

#endif  /* WBEM___CIM_DATETIME__HPP */
