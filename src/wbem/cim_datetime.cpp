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

#include <ncbi_pch.hpp>
#include <wbem/cim_datetime.hpp>
#include <stdio.h>


BEGIN_WBEM_SCOPE


static const size_t kDateTimeLength = 25;
static const Uint8  kMaxIntervalDays = 99999999;
static const Int8   kMicrosecondsPerSecond = 1000000;
static const Int8   kSecondsPerDay = 86400;


// Days since 0001-01-01 of the proleptic Gregorian calendar
static Int8 s_DaysFromCivil(int year, int month, int day)
{
    Int8 y = year - (month <= 2 ? 1 : 0);
    Int8 era = (y >= 0 ? y : y - 399) / 400;
    Int8 yoe = y - era * 400;
    Int8 mp = (month + 9) % 12;
    Int8 doy = (153 * mp + 2) / 5 + day - 1;
    Int8 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    // 719162 days between 0001-01-01 and 1970-01-01
    return era * 146097 + doe - 719468 + 719162;
}


static void s_CivilFromDays(Int8 days, int* year, int* month, int* day)
{
    Int8 z = days - 719162 + 719468;
    Int8 era = (z >= 0 ? z : z - 146096) / 146097;
    Int8 doe = z - era * 146097;
    Int8 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    Int8 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    Int8 mp = (5 * doy + 2) / 153;
    *day   = int(doy - (153 * mp + 2) / 5 + 1);
    *month = int(mp < 10 ? mp + 3 : mp - 9);
    *year  = int(yoe + era * 400 + (*month <= 2 ? 1 : 0));
}


static int s_DaysInMonth(int year, int month)
{
    static const int kDays[] = { 31,28,31,30,31,30,31,31,30,31,30,31 };
    if (month == 2  &&
        (year % 4 == 0  &&  (year % 100 != 0  ||  year % 400 == 0))) {
        return 29;
    }
    return kDays[month - 1];
}


// Decimal field of the datetime string; ASCII digits only
static Uint8 s_ParseField(const string& dtstr, size_t pos, size_t len)
{
    Uint8 value = 0;
    for (size_t i = pos;  i < pos + len;  ++i) {
        char c = dtstr[i];
        if (c < '0'  ||  c > '9') {
            NCBI_THROW(CCimException, eValue,
                       "Invalid CIM datetime string: '" + dtstr + "'");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}


static CCimDateTime s_FromUtcMicroseconds(Int8 value, int minutes_from_utc)
{
    value += Int8(minutes_from_utc) * 60 * kMicrosecondsPerSecond;
    Int8 usec = value % kMicrosecondsPerSecond;
    Int8 secs = value / kMicrosecondsPerSecond;
    if (usec < 0) {
        usec += kMicrosecondsPerSecond;
        --secs;
    }
    Int8 days = secs / kSecondsPerDay;
    Int8 sod  = secs % kSecondsPerDay;
    if (sod < 0) {
        sod += kSecondsPerDay;
        --days;
    }
    int year, month, day;
    s_CivilFromDays(days, &year, &month, &day);
    return CCimDateTime::CreatePointInTime(year, month, day,
                                           int(sod / 3600),
                                           int(sod % 3600 / 60),
                                           int(sod % 60),
                                           int(usec),
                                           minutes_from_utc);
}


CCimDateTime::CCimDateTime(void)
    : m_IsInterval(true),
      m_Year(0), m_Month(0), m_Day(0), m_Days(0),
      m_Hour(0), m_Minute(0), m_Second(0), m_Microsecond(0),
      m_MinutesFromUtc(0)
{
}


CCimDateTime::CCimDateTime(const string& dtstr)
    : m_IsInterval(true),
      m_Year(0), m_Month(0), m_Day(0), m_Days(0),
      m_Hour(0), m_Minute(0), m_Second(0), m_Microsecond(0),
      m_MinutesFromUtc(0)
{
    x_Parse(dtstr);
}


CCimDateTime::CCimDateTime(const CTime& time)
    : m_IsInterval(false),
      m_Year(time.Year()), m_Month(time.Month()), m_Day(time.Day()),
      m_Days(0),
      m_Hour(time.Hour()), m_Minute(time.Minute()), m_Second(time.Second()),
      m_Microsecond(int(time.MicroSecond())),
      m_MinutesFromUtc(0)
{
    if (time.IsEmpty()) {
        NCBI_THROW(CCimException, eValue,
                   "Cannot create CIM datetime from an empty CTime");
    }
    if (time.IsLocalTime()) {
        m_MinutesFromUtc = int(time.TimeZoneDiff() / 60);
    }
    x_Validate();
}


CCimDateTime::CCimDateTime(const CTimeSpan& span)
    : m_IsInterval(true),
      m_Year(0), m_Month(0), m_Day(0), m_Days(0),
      m_Hour(0), m_Minute(0), m_Second(0), m_Microsecond(0),
      m_MinutesFromUtc(0)
{
    if (span.GetSign() == eNegative) {
        NCBI_THROW(CCimException, eValue,
                   "Cannot create CIM datetime interval from a negative "
                   "time span");
    }
    Int8 secs = span.GetCompleteSeconds();
    m_Days        = Uint8(secs / kSecondsPerDay);
    m_Hour        = int(secs % kSecondsPerDay / 3600);
    m_Minute      = int(secs % 3600 / 60);
    m_Second      = int(secs % 60);
    m_Microsecond = int(span.GetNanoSecondsAfterSecond() / 1000);
    x_Validate();
}


CCimDateTime CCimDateTime::CreatePointInTime(int year, int month, int day,
                                             int hour, int minute, int second,
                                             int microsecond,
                                             int minutes_from_utc)
{
    CCimDateTime dt;
    dt.m_IsInterval     = false;
    dt.m_Year           = year;
    dt.m_Month          = month;
    dt.m_Day            = day;
    dt.m_Hour           = hour;
    dt.m_Minute         = minute;
    dt.m_Second         = second;
    dt.m_Microsecond    = microsecond;
    dt.m_MinutesFromUtc = minutes_from_utc;
    dt.x_Validate();
    return dt;
}


CCimDateTime CCimDateTime::CreateInterval(Uint8 days, int hours, int minutes,
                                          int seconds, int microseconds)
{
    CCimDateTime dt;
    dt.m_Days        = days;
    dt.m_Hour        = hours;
    dt.m_Minute      = minutes;
    dt.m_Second      = seconds;
    dt.m_Microsecond = microseconds;
    dt.x_Validate();
    return dt;
}


CCimDateTime CCimDateTime::Now(void)
{
    return CCimDateTime(CTime(CTime::eCurrent, CTime::eLocal));
}


CCimDateTime CCimDateTime::FromTimestamp(time_t timestamp)
{
    return FromTimestamp(timestamp, GetLocalUtcOffset());
}


CCimDateTime CCimDateTime::FromTimestamp(time_t timestamp,
                                         int    minutes_from_utc)
{
    Int8 value = (s_DaysFromCivil(1970, 1, 1) * kSecondsPerDay +
                  Int8(timestamp)) * kMicrosecondsPerSecond;
    return s_FromUtcMicroseconds(value, minutes_from_utc);
}


int CCimDateTime::GetLocalUtcOffset(void)
{
    CTime now(CTime::eCurrent, CTime::eLocal);
    return int(now.TimeZoneDiff() / 60);
}


CTime CCimDateTime::GetTime(void) const
{
    if (m_IsInterval) {
        NCBI_THROW(CCimException, eValue,
                   "CIM datetime interval has no point in time: " +
                   AsString());
    }
    CTime time(m_Year, m_Month, m_Day, m_Hour, m_Minute, m_Second,
               long(m_Microsecond) * 1000, CTime::eGmt);
    time.AddMinute(-m_MinutesFromUtc);
    return time;
}


CTimeSpan CCimDateTime::GetTimeSpan(void) const
{
    if ( !m_IsInterval ) {
        NCBI_THROW(CCimException, eValue,
                   "CIM datetime point in time is not an interval: " +
                   AsString());
    }
    return CTimeSpan(long(m_Days), m_Hour, m_Minute, m_Second,
                     long(m_Microsecond) * 1000);
}


string CCimDateTime::AsString(void) const
{
    char buf[32];
    if (m_IsInterval) {
        ::sprintf(buf, "%08u%02d%02d%02d.%06d:000",
                  (unsigned int) m_Days, m_Hour, m_Minute, m_Second,
                  m_Microsecond);
    } else {
        int offset = m_MinutesFromUtc;
        char sign = '+';
        if (offset < 0) {
            sign = '-';
            offset = -offset;
        }
        ::sprintf(buf, "%04d%02d%02d%02d%02d%02d.%06d%c%03d",
                  m_Year, m_Month, m_Day, m_Hour, m_Minute, m_Second,
                  m_Microsecond, sign, offset);
    }
    return buf;
}


bool CCimDateTime::operator==(const CCimDateTime& other) const
{
    return m_IsInterval == other.m_IsInterval
        &&  x_GetValue() == other.x_GetValue();
}


size_t CCimDateTime::GetHash(void) const
{
    Uint8 value = Uint8(x_GetValue());
    size_t hash = size_t(value ^ (value >> 32));
    return m_IsInterval ? ~hash : hash;
}


void CCimDateTime::x_Parse(const string& dtstr)
{
    if (dtstr.size() != kDateTimeLength  ||  dtstr[14] != '.') {
        NCBI_THROW(CCimException, eValue,
                   "Invalid CIM datetime string: '" + dtstr + "'");
    }
    char sep = dtstr[21];
    if (sep == ':') {
        if (dtstr.compare(22, 3, "000") != 0) {
            NCBI_THROW(CCimException, eValue,
                       "Invalid CIM datetime interval string: '" +
                       dtstr + "'");
        }
        m_IsInterval = true;
        m_Days = s_ParseField(dtstr, 0, 8);
    } else if (sep == '+'  ||  sep == '-') {
        m_IsInterval = false;
        m_Year  = int(s_ParseField(dtstr, 0, 4));
        m_Month = int(s_ParseField(dtstr, 4, 2));
        m_Day   = int(s_ParseField(dtstr, 6, 2));
        m_MinutesFromUtc = int(s_ParseField(dtstr, 22, 3));
        if (sep == '-') {
            m_MinutesFromUtc = -m_MinutesFromUtc;
        }
    } else {
        NCBI_THROW(CCimException, eValue,
                   "Invalid CIM datetime string: '" + dtstr + "'");
    }
    m_Hour        = int(s_ParseField(dtstr, 8, 2));
    m_Minute      = int(s_ParseField(dtstr, 10, 2));
    m_Second      = int(s_ParseField(dtstr, 12, 2));
    m_Microsecond = int(s_ParseField(dtstr, 15, 6));
    x_Validate();
}


void CCimDateTime::x_Validate(void) const
{
    bool valid = m_Hour >= 0  &&  m_Hour < 24
        &&  m_Minute >= 0  &&  m_Minute < 60
        &&  m_Second >= 0  &&  m_Second < 60
        &&  m_Microsecond >= 0  &&  m_Microsecond < kMicrosecondsPerSecond;
    if (m_IsInterval) {
        valid = valid  &&  m_Days <= kMaxIntervalDays;
    } else {
        valid = valid
            &&  m_Year >= 1  &&  m_Year <= 9999
            &&  m_Month >= 1  &&  m_Month <= 12
            &&  m_Day >= 1  &&  m_Day <= s_DaysInMonth(m_Year, m_Month)
            &&  m_MinutesFromUtc > -1000  &&  m_MinutesFromUtc < 1000;
    }
    if ( !valid ) {
        NCBI_THROW_FMT(CCimException, eValue,
                       "CIM datetime field out of range: " <<
                       (m_IsInterval ? "interval " : "point in time ") <<
                       m_Year << '-' << m_Month << '-' << m_Day << ' ' <<
                       m_Days << ' ' << m_Hour << ':' << m_Minute << ':' <<
                       m_Second << '.' << m_Microsecond << ' ' <<
                       m_MinutesFromUtc);
    }
}


Int8 CCimDateTime::x_GetValue(void) const
{
    Int8 secs = Int8(m_Hour) * 3600 + m_Minute * 60 + m_Second;
    if (m_IsInterval) {
        secs += Int8(m_Days) * kSecondsPerDay;
    } else {
        secs += s_DaysFromCivil(m_Year, m_Month, m_Day) * kSecondsPerDay;
        secs -= Int8(m_MinutesFromUtc) * 60;
    }
    return secs * kMicrosecondsPerSecond + m_Microsecond;
}


END_WBEM_SCOPE
