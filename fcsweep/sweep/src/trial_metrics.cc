// IRON: iron_headers
/*
 * Distribution A
 *
 * Approved for Public Release, Distribution Unlimited
 *
 * EdgeCT (IRON) Software Contract No.: HR0011-15-C-0097
 * DCOMP (GNAT)  Software Contract No.: HR0011-17-C-0050
 * Copyright (c) 2015-20 Raytheon BBN Technologies Corp.
 *
 * This material is based upon work supported by the Defense Advanced
 * Research Projects Agency under Contracts No. HR0011-15-C-0097 and
 * HR0011-17-C-0050. Any opinions, findings and conclusions or
 * recommendations expressed in this material are those of the author(s)
 * and do not necessarily reflect the views of the Defense Advanced
 * Research Project Agency.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/* IRON: end */

#include "trial_metrics.h"

#include "string_utils.h"
#include "unused.h"

#include <cmath>

using ::fcsweep::CaptureStatus;
using ::fcsweep::StringUtils;
using ::fcsweep::TrialConfig;
using ::fcsweep::TrialMetrics;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "TrialMetrics";

  const char*  kFieldNames[] =
  {
    "recv_buf", "delay_ms", "read_size", "send_rate_mbps", "duration",
    "receiver_capacity_bps", "send_rate_bps", "oversubscription_ratio",
    "duration_actual", "bytes_transferred", "bytes_received",
    "actual_throughput_kbps", "sender_block_count", "sender_blocked_ms",
    "zero_window_count", "zero_window_duration_ms", "zero_window_pct",
    "window_min", "window_max", "window_mean", "window_oscillations",
    "total_packets", "retransmit_count", "dup_ack_count", "capture_status",
    "timestamp", "success", "error"
  };

  const size_t  kNumFields = sizeof(kFieldNames) / sizeof(kFieldNames[0]);

  /// Render a floating point column, trimming trailing zeros so that whole
  /// values read as "100.0" rather than "100.000000".
  string FormatDouble(double value)
  {
    if (std::isinf(value))
    {
      return ((value > 0.0) ? "inf" : "-inf");
    }

    string  str = StringUtils::ToString(value, 6);

    size_t  last = str.find_last_not_of('0');

    if ((last != string::npos) && (str[last] == '.'))
    {
      ++last;
    }

    return str.substr(0, last + 1);
  }
}

//============================================================================
TrialMetrics::TrialMetrics(const TrialConfig& config)
    : recv_buf(config.recv_buf_bytes()),
      delay_ms(config.read_delay_ms()),
      read_size(config.read_chunk_bytes()),
      send_rate_mbps(config.send_rate_mbps()),
      duration(config.duration_sec()),
      receiver_capacity_bps(config.ReceiverCapacityBps()),
      send_rate_bps(config.SendRateBps()),
      oversubscription_ratio(config.OversubscriptionRatio()),
      duration_actual(0.0),
      bytes_transferred(0),
      bytes_received(0),
      actual_throughput_kbps(0.0),
      sender_block_count(0),
      sender_blocked_ms(0.0),
      zero_window_count(0),
      zero_window_duration_ms(0.0),
      zero_window_pct(0.0),
      window_min(0),
      window_max(0),
      window_mean(0.0),
      window_oscillations(0),
      total_packets(0),
      retransmit_count(0),
      dup_ack_count(0),
      capture_status(CAPTURE_DISABLED),
      timestamp(),
      success(false),
      error()
{
}

//============================================================================
void TrialMetrics::ComputeDerived(double zero_window_event_ms)
{
  // The per-event duration is a fixed estimate, not a measurement.
  zero_window_duration_ms = zero_window_count * zero_window_event_ms;

  if (duration_actual > 0.0)
  {
    actual_throughput_kbps = (static_cast<double>(bytes_transferred) /
                              duration_actual) / 1024.0;
    zero_window_pct        = ((zero_window_duration_ms / 1000.0) /
                              duration_actual) * 100.0;
  }
  else
  {
    actual_throughput_kbps = 0.0;
    zero_window_pct        = 0.0;
  }
}

//============================================================================
string TrialMetrics::ToCsvRow() const
{
  vector<string>  cols;

  cols.reserve(kNumFields);

  cols.push_back(StringUtils::ToString(recv_buf));
  cols.push_back(FormatDouble(delay_ms));
  cols.push_back(StringUtils::ToString(read_size));
  cols.push_back(FormatDouble(send_rate_mbps));
  cols.push_back(FormatDouble(duration));
  cols.push_back(FormatDouble(receiver_capacity_bps));
  cols.push_back(FormatDouble(send_rate_bps));
  cols.push_back(FormatDouble(oversubscription_ratio));
  cols.push_back(FormatDouble(duration_actual));
  cols.push_back(StringUtils::ToString(bytes_transferred));
  cols.push_back(StringUtils::ToString(bytes_received));
  cols.push_back(FormatDouble(actual_throughput_kbps));
  cols.push_back(StringUtils::ToString(sender_block_count));
  cols.push_back(FormatDouble(sender_blocked_ms));
  cols.push_back(StringUtils::ToString(zero_window_count));
  cols.push_back(FormatDouble(zero_window_duration_ms));
  cols.push_back(FormatDouble(zero_window_pct));
  cols.push_back(StringUtils::ToString(window_min));
  cols.push_back(StringUtils::ToString(window_max));
  cols.push_back(FormatDouble(window_mean));
  cols.push_back(StringUtils::ToString(window_oscillations));
  cols.push_back(StringUtils::ToString(total_packets));
  cols.push_back(StringUtils::ToString(retransmit_count));
  cols.push_back(StringUtils::ToString(dup_ack_count));
  cols.push_back(CaptureStatusToString(capture_status));
  cols.push_back(CsvEscape(timestamp));
  cols.push_back(success ? "True" : "False");
  cols.push_back(CsvEscape(error));

  string  row;

  for (size_t i = 0; i < cols.size(); ++i)
  {
    if (i > 0)
    {
      row.append(",");
    }
    row.append(cols[i]);
  }

  return row;
}

//============================================================================
const vector<string>& TrialMetrics::FieldNames()
{
  static const vector<string>  names(kFieldNames, kFieldNames + kNumFields);

  return names;
}

//============================================================================
string TrialMetrics::CsvHeader()
{
  const vector<string>&  names = FieldNames();
  string                 header;

  for (size_t i = 0; i < names.size(); ++i)
  {
    if (i > 0)
    {
      header.append(",");
    }
    header.append(names[i]);
  }

  return header;
}

//============================================================================
const char* TrialMetrics::CaptureStatusToString(CaptureStatus status)
{
  switch (status)
  {
    case CAPTURE_DISABLED:
      return "disabled";

    case CAPTURE_OK:
      return "ok";

    case CAPTURE_UNAVAILABLE:
      return "unavailable";

    case CAPTURE_PARTIAL:
      return "partial";
  }

  return "unknown";
}

//============================================================================
string TrialMetrics::CsvEscape(const string& field)
{
  if (field.find_first_of(",\"\r\n") == string::npos)
  {
    return field;
  }

  string  escaped("\"");

  for (size_t i = 0; i < field.size(); ++i)
  {
    if (field[i] == '"')
    {
      escaped.append("\"\"");
    }
    else
    {
      escaped.push_back(field[i]);
    }
  }

  escaped.append("\"");

  return escaped;
}
