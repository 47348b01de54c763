// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Result.hxx"
#include "Error.hxx"

namespace Pg {

std::string
Result::GetOnlyStringChecked() const noexcept
{
	if (!IsQuerySuccessful() || IsEmpty() || IsValueNull(0, 0))
		return {};

	return GetValue(0, 0);
}

Error::Error(Result &&_result)
	:result(std::move(_result)),
	 message(result.GetErrorMessage())
{
	while (!message.empty() && message.back() == '\n')
		message.pop_back();
}

} // namespace Pg
