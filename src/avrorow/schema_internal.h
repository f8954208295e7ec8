/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#pragma once

#include <nanoarrow/nanoarrow.h>

#include "avrorow/avrorow_export.h"
#include "avrorow/result.h"
#include "avrorow/type_fwd.h"

namespace avrorow {

/// \brief Convert a record schema node to an Arrow schema.
///
/// Each field becomes a child of a struct schema.  A union of null and one
/// other member becomes a nullable column of that member's type; unions with
/// more than one non-null member have no columnar counterpart.
///
/// \param[in] schema The record schema node to convert.
/// \param[out] out The Arrow schema to convert to.  It is released on error.
/// \return NotSupported for multi-member unions, InvalidSchema if nanoarrow
/// fails.
AVROROW_EXPORT Status ToArrowSchema(const RecordNode& schema, ArrowSchema* out);

}  // namespace avrorow
