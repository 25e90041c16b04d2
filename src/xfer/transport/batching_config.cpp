/* Flow-Xfer: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "xfer/transport/batching_config.hpp"
#include "xfer/transport/error.hpp"
#include <flow/error/error.hpp>
#include <limits>

namespace xfer::transport
{

size_t Batching_config::max_flush() const
{
  return m_base_unit * m_max_multiplier;
}

bool Batching_config::validate(flow::log::Logger* logger_ptr, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Batching_config::validate, logger_ptr, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  if ((m_base_unit == 0) || (m_max_multiplier == 0))
  {
    FLOW_LOG_WARNING("Batching_config [" << *this << "]: Base unit and max multiplier must both be positive.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else
  if (m_max_multiplier > (std::numeric_limits<size_t>::max() / m_base_unit))
  {
    FLOW_LOG_WARNING("Batching_config [base_unit[" << m_base_unit << "] max_multiplier[" << m_max_multiplier << "]]: "
                     "Max flush size (base unit times max multiplier) does not fit in size_t.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else
  if ((m_outstanding_cap != 0) && (m_outstanding_cap < max_flush()))
  {
    FLOW_LOG_WARNING("Batching_config [" << *this << "]: Outstanding-bytes cap must be 0 (unbounded) or at least "
                     "the max flush size [" << max_flush() << "]; else even a single full batch would routinely "
                     "stall the producer.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  err_code->clear();
  return true;
} // Batching_config::validate()

std::ostream& operator<<(std::ostream& os, const Batching_config& val)
{
  return os << "base_unit[" << val.m_base_unit << "] max_multiplier[" << val.m_max_multiplier << "] "
               "max_flush[" << val.max_flush() << "] outstanding_cap[" << val.m_outstanding_cap << ']';
}

} // namespace xfer::transport
