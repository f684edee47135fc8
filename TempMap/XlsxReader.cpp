// Copyright © 2025 Cadell Richard Anderson

// XlsxReader.cpp

#include "XlsxReader.h"
#include <iostream>
#include <string>

#include <QString>
#include <QStringList>
#include <QVariant>
#include "xlsxcell.h"
#include "xlsxcellrange.h"
#include "xlsxdocument.h"
#include "xlsxworksheet.h"

namespace tempmap::XlsxReader {

    namespace {
        // Fills kind/text/number from the stored value; false for an empty cell
        // (formatted blanks inside merged ranges included).
        static bool to_template_cell(const QXlsx::Cell& source, TemplateCell& out) {
            const QVariant value = source.value();
            if (!value.isValid() || value.isNull()) return false;

            out.text = value.toString().toStdString();
            switch (source.cellType()) {
            case QXlsx::Cell::BooleanType:
                out.kind = CellKind::Boolean;
                out.number = value.toBool() ? 1.0 : 0.0;
                return true;
            case QXlsx::Cell::ErrorType:
                out.kind = CellKind::Error;
                return true;
            case QXlsx::Cell::SharedStringType:
            case QXlsx::Cell::StringType:
            case QXlsx::Cell::InlineStringType:
                out.kind = CellKind::Text;
                return !out.text.empty();
            default:
                break;
            }

            bool ok = false;
            const double number = value.toDouble(&ok);
            if (ok) {
                out.kind = CellKind::Number;
                out.number = number;
            }
            else {
                out.kind = CellKind::Text;
            }
            return out.kind == CellKind::Number || !out.text.empty();
        }
    }

    std::expected<TemplateGrid, TempMapError> readFirstSheet(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::unexpected(TempMapError::MissingTemplate);
        }

        QXlsx::Document xlsx(QString::fromStdString(path.string()));
        if (!xlsx.isLoadPackage()) {
            std::cerr << "[Xlsx] Not a readable workbook: " << path.string() << "\n";
            return std::unexpected(TempMapError::InvalidTemplate);
        }

        const QStringList sheets = xlsx.sheetNames();
        if (sheets.isEmpty() || !xlsx.selectSheet(sheets.first())) {
            std::cerr << "[Xlsx] Workbook has no sheets: " << path.string() << "\n";
            return std::unexpected(TempMapError::InvalidTemplate);
        }
        QXlsx::Worksheet* sheet = xlsx.currentWorksheet();
        if (!sheet) {
            // First sheet is a chart sheet.
            std::cerr << "[Xlsx] First sheet is not a worksheet: " << path.string() << "\n";
            return std::unexpected(TempMapError::InvalidTemplate);
        }

        TemplateGrid grid;
        const QXlsx::CellRange used = sheet->dimension();
        if (!used.isValid()) return grid;

        for (int row = used.firstRow(); row <= used.lastRow(); ++row) {
            for (int col = used.firstColumn(); col <= used.lastColumn(); ++col) {
                auto source = sheet->cellAt(row, col);
                if (!source) continue;

                TemplateCell cell;
                cell.ref = CellRef{ static_cast<u32>(row), static_cast<u32>(col) };
                if (to_template_cell(*source, cell)) grid.cells.push_back(std::move(cell));
            }
        }
        return grid;
    }

} // namespace tempmap::XlsxReader
