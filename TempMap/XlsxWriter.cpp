// Copyright © 2025 Cadell Richard Anderson

// XlsxWriter.cpp

#include "XlsxWriter.h"
#include <iostream>
#include <string>

#include <QColor>
#include <QString>
#include <QVariant>
#include "xlsxcellrange.h"
#include "xlsxconditionalformatting.h"
#include "xlsxdocument.h"
#include "xlsxformat.h"

namespace tempmap::XlsxWriter {

    namespace {
        static QXlsx::Format title_format() {
            QXlsx::Format format;
            format.setFontBold(true);
            format.setFontSize(12);
            format.setHorizontalAlignment(QXlsx::Format::AlignHCenter);
            format.setVerticalAlignment(QXlsx::Format::AlignVCenter);
            return format;
        }

        static QColor to_qcolor(RgbColor c) {
            return QColor(static_cast<int>((c.value >> 16) & 0xFF), static_cast<int>((c.value >> 8) & 0xFF),
                static_cast<int>(c.value & 0xFF));
        }

        static std::unexpected<PipelineFailure> save_failed(const std::filesystem::path& path, const std::string& what) {
            return std::unexpected(PipelineFailure{ TempMapError::SaveFailed, path.string() + ": " + what });
        }
    }

    std::expected<void, PipelineFailure> save(
        const OutputGrid& grid, const std::optional<ColorScaleSpec>& colorScale,
        const std::filesystem::path& path)
    {
        QXlsx::Document xlsx;
        const QString sheetName = QString::fromLatin1(kSheetName);
        if (!xlsx.addSheet(sheetName) || !xlsx.selectSheet(sheetName)) {
            return save_failed(path, "cannot create sheet");
        }

        const QXlsx::Format titleFormat = title_format();
        for (const TitleRow& title : grid.titles) {
            const int row = static_cast<int>(title.row);
            const int first = static_cast<int>(title.mergeFirstCol);
            const int last = static_cast<int>(title.mergeLastCol);
            if (last > first && !xlsx.mergeCells(QXlsx::CellRange(row, first, row, last), titleFormat)) {
                return save_failed(path, "cannot merge title row " + std::to_string(row));
            }
            if (!xlsx.write(row, first, QString::fromStdString(title.text), titleFormat)) {
                return save_failed(path, "cannot write title row " + std::to_string(row));
            }
        }

        for (const auto& [ref, value] : grid.cells) {
            if (!xlsx.write(static_cast<int>(ref.row), static_cast<int>(ref.col), QVariant(value))) {
                return save_failed(path, "cannot write cell " + std::to_string(ref.row) + "," + std::to_string(ref.col));
            }
        }

        if (colorScale) {
            QXlsx::ConditionalFormatting scale;
            scale.add3ColorScaleRule(to_qcolor(colorScale->lowColor), to_qcolor(colorScale->midColor),
                to_qcolor(colorScale->highColor));
            scale.addRange(QXlsx::CellRange(
                static_cast<int>(colorScale->rangeFirst.row), static_cast<int>(colorScale->rangeFirst.col),
                static_cast<int>(colorScale->rangeLast.row), static_cast<int>(colorScale->rangeLast.col)));
            if (!xlsx.addConditionalFormatting(scale)) {
                return save_failed(path, "cannot add color scale");
            }
        }

        if (!xlsx.saveAs(QString::fromStdString(path.string()))) {
            std::cerr << "[Xlsx] Failed to save " << path.string() << "\n";
            return save_failed(path, "cannot write workbook");
        }
        return {};
    }

} // namespace tempmap::XlsxWriter
