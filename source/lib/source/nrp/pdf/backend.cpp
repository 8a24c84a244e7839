#include <nrp/pdf/backend.hpp>

#include <nrp/pdf/podofo_backend.hpp>

std::unique_ptr<PdfDocument> CreatePdfDocument(Size page_size)
{
    return std::make_unique<PoDoFoDocument>(page_size);
}
