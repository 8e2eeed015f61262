// Copyright (c) 2018-2024 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of canopy, which is based on roofer
// (https://github.com/3DBAG/roofer)

// canopy is free software: you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. canopy is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with canopy. If not, see <https://www.gnu.org/licenses/>.

#pragma once
#include <canopy/planting/Summary.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace canopy::io {

  struct SummaryWriterInterface {
    bool prettyPrint_ = true;

    virtual ~SummaryWriterInterface() = default;

    virtual void write_summary(std::ostream& output_stream,
                               const planting::LocationSummary& summary) = 0;

    /**
     * @brief Write the status of every location and the file its summary
     * was written to.
     *
     * @param summary_files One entry per summary, empty if there is no file
     */
    virtual void write_index(
        std::ostream& output_stream,
        const std::vector<planting::LocationSummary>& summaries,
        const std::vector<std::string>& summary_files) = 0;
  };

  std::unique_ptr<SummaryWriterInterface> createSummaryWriterJSON();

}  // namespace canopy::io
