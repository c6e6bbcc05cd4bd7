#pragma once

namespace vktri::frame
{

	struct WindowEvent
	{
		enum class Kind
		{
			CloseRequested,
			Resized,
			Other
		};

		Kind kind = Kind::Other;
		const void *window = nullptr; // identity of the emitting window
		int width = 0;
		int height = 0;
	};

}
